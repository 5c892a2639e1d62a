/*
  Copyright (c) 2012 by Procera Networks, Inc. ("PROCERA")

  Permission to use, copy, modify, and/or distribute this software for
  any purpose with or without fee is hereby granted, provided that the
  above copyright notice and this permission notice appear in all
  copies.

  THE SOFTWARE IS PROVIDED "AS IS" AND PROCERA DISCLAIMS ALL WARRANTIES
  WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
  MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL PROCERA BE LIABLE FOR
  ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
  WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
  ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT
  OF OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
#pragma once

#include <istream>
#include <boost/shared_ptr.hpp>

#include "error.hpp"

namespace shellout {
	/*
	  cmd

	  What to run. _command is resolved through $PATH unless it
	  contains a slash. An empty _env means the child inherits the
	  environment of the calling process; a non-empty one replaces it
	  completely. An empty _dir means the current directory. _stdin is
	  not owned and is read to the end; null gives the child
	  /dev/null.
	*/
	struct cmd {
		cmd() : _stdin(0) {
		}

		explicit cmd(const string& command) : _command(command), _stdin(0) {
		}

		string        _command;
		stringvec     _args;
		stringvec     _env; // KEY=VALUE
		string        _dir;
		std::istream* _stdin;
	};

	// What a command left behind. Only meaningful when run() did not
	// report an error. _stdout and _stderr hold raw bytes.
	struct result {
		result() : _exitcode(0) {
		}

		int    _exitcode; // -1 if the child was killed by a signal
		string _stdout;
		string _stderr;
	};

	/*
	  shell

	  Runs a cmd to completion and captures the result. The calling
	  thread blocks until the child has exited and all its output has
	  been read.

	  A process exiting with a non-zero status is not an error, the
	  status is just reported in result::_exitcode. Errors are
	  command_not_found (nothing was started) and command_process_failed
	  (the process could not be started or run). On error the returned
	  result is empty.

	  posix_shell is the real thing, tests can provide their own.
	*/
	struct shell {
		virtual ~shell() {}

		virtual result run(const cmd& c, error& err) = 0;

		// throws shell_error
		result run(const cmd& c);
	};

	typedef boost::shared_ptr<shell> shell_ptr;

	struct posix_shell : public shell {
		using shell::run;
		virtual result run(const cmd& c, error& err);
	};

	// The default instance. It has no state, any number of threads
	// can use it at the same time.
	shell& default_shell();

	shell_ptr new_shell();

	// default_shell().run(...)
	result run(const cmd& c, error& err);
	result run(const cmd& c);

	// command line for logging, space separated
	string to_string(const cmd& c);
}
