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
#include <sys/types.h>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace shellout {
	using boost::posix_time::ptime;

	/*
	  process

	  One child process with its stdio connected to pipes owned by
	  the parent. Used by posix_shell, one per call:

	    process p;
	    p.begin(path, argv, envp, dir, in != 0, ec);
	    p.drain(in, out, err, ec);
	    p.wait(ec);

	  Every failing step sets ec to the errno (system category) and
	  _stage to the name of the step that failed. The destructor
	  closes any fd still open and reaps a child that was started
	  but never waited for.
	*/
	struct process {
		process();
		~process();

		// Fork and exec path. argv and envp must be null terminated.
		// workdir may be empty. If with_stdin is false the child gets
		// /dev/null on fd 0. Returns false if the child could not be
		// started, including chdir/exec failures in the child.
		bool begin(const char* path, char* const* argv, char* const* envp,
		           const string& workdir, bool with_stdin, error_code& ec);

		// Feed in (if any) to the child and collect stdout/stderr
		// until both reach end of file.
		bool drain(std::istream* in, string& out, string& err, error_code& ec);

		// Reap the child. A signalled child gets exitcode -1.
		bool wait(error_code& ec);

		bool is_active() const;
		void close_pipes();

		int exitcode;
		int termsig; // 0 unless killed by a signal
		pid_t pid;
		int stdin_pipe; // write end, -1 when closed
		int stdout_pipe; // read end
		int stderr_pipe; // read end

		const char* _stage; // last step that failed
		ptime started_at;

	private:
		process(const process&);
		process& operator=(const process&);
	};
}
