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

namespace shellout {
	/*
	  settings

	  Configuration for the shellout-run tool, read from INFO
	  formatted files:

	    log {
	        level info
	        targets "console file"
	        file /var/log/shellout.log
	        colors false
	    }
	    run {
	        workdir /tmp
	        inherit_env true
	        env {
	            LANG C
	        }
	    }

	  The first file in the list that exists is read, the rest are
	  ignored. Bad values are errors.
	*/
	struct settings {
		typedef logging::LogLevels LogLevel;

		settings();
		bool  boot(const stringvec& configs, bool verbose = true);
		bool  read_config(const stringvec& configs, bool verbose = true);

		// applies the log settings to the logging module
		void  apply_logging() const;

		// log
		LogLevel    _loglevel; // trace / info / warn / error
		int         _logmodes; // logging::ModeFlags
		string      _logfile;
		bool        _colors;

		// run
		string      _workdir;
		bool        _inherit_env; // start from the caller's environment when adding variables
		stringvec   _env; // KEY=VALUE, in file order

		// files that were actually read
		stringvec   _loaded;
	};

	// parses a target list like "console,syslog" into logging::ModeFlags
	int parse_log_targets(const string& targets);
}
