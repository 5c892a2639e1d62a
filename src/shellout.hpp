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

#define SHELLOUT_VERSION 1

#include <stdlib.h>
#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>

#include <boost/foreach.hpp>
#include <boost/system/error_code.hpp>

#include "logging.hpp"

#define SHELLOUT_CONFIG_FILES "./shellout.conf;/etc/shellout/shellout.conf"
#define SHELLOUT_LOG_FILE "shellout.log"

#define ASIZE(a) (sizeof(a)/sizeof((a)[0]))

#define FOREACH BOOST_FOREACH

/*
 * shellout
 *
 * Runs a command, captures what it writes to stdout and stderr and
 * hands back the exit code. That's it. No streaming, no job control.
 *
 * Things to look at first:
 *
 * shell.hpp is the public interface: cmd describes what to run,
 * result is what came back, and shell is the single-method interface
 * with posix_shell as the real implementation.
 *
 * error.hpp holds the two error kinds and the category that makes
 * them comparable as boost::system::error_code values.
 *
 * process.hpp does the actual fork/exec/pipe work.
 *
 * run.hpp and shellout.cpp are the shellout-run command line tool.
 *
 * The following boost libraries are used:
 *
 * system - error_code/error_category for error classification
 * date_time - for posix_time, timing of executed commands
 * program_options - to parse command lines
 * property_tree - for parsing the configuration file
 * algorithm/tokenizer - string splitting
 */

namespace shellout {
	static const int version = SHELLOUT_VERSION;

	using std::string;
	using boost::system::error_code;

	typedef std::vector<string> stringvec;
}

namespace std {
	inline std::vector<std::string>& operator<<(std::vector<std::string>& v, const char* t) {
		v.push_back(t);
		return v;
	}
}
