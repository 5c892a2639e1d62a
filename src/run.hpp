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

#include <ostream>
#include <fstream>

namespace shellout {
	struct settings;
	struct shell;
	struct cmd;

	// exit codes of shellout-run when the command itself never ran
	static const int ExitNotFound = 127;
	static const int ExitProcessFailed = 126;
	static const int ExitSignalled = 1;

	struct run_options {
		run_options() : _input(0), _summary(false) {
		}

		stringvec     _argv; // command and arguments
		stringvec     _env; // KEY=VALUE from the command line
		string        _dir;
		std::istream* _input;
		bool          _summary;
	};

	// Parse shellout-run's command line into cfg, opts and the -i
	// argument, reading config files and applying log settings on the
	// way. Returns 0 to go on, >0 to exit with that code and <0 to exit
	// 0 (help, version). Throws boost::program_options::error on bad
	// options.
	int parse_commandline(int argc, char* argv[], settings& cfg, run_options& opts, string& input);

	// Point in at the stream named by name for the command's stdin:
	// "-" is our own stdin, anything else is opened with file. Pipes
	// and FIFOs work as well as regular files, they are read as the
	// command consumes them. An empty name leaves in alone.
	bool open_input(const string& name, std::ifstream& file, std::istream*& in);

	// Combine settings and command line options into a cmd.
	// Later entries for the same variable win: caller environment
	// (when inherit_env is set), then config, then command line.
	// Returns false for bad KEY=VALUE entries or an empty argv.
	bool make_cmd(const settings& cfg, const run_options& opts, cmd& out);

	// Run c through sh, copy its output to out/err and return the
	// exit code shellout-run should exit with.
	int run(shell& sh, const cmd& c, bool summary, std::ostream& out, std::ostream& err);
}
