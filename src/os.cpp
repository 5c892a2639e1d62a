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
#include "shellout.hpp"
#include "os.hpp"

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

extern char** environ;

using namespace std;

namespace shellout {
	namespace os {
		const char* environ(const char* var) {
			return getenv(var);
		}

		stringvec environment() {
			stringvec ret;
			for (char** e = ::environ; e && *e; ++e)
				ret.push_back(*e);
			return ret;
		}

		namespace path {
			bool isexec(const char* fname) {
				struct stat s;

				if (stat(fname, &s) == 0 && S_ISREG(s.st_mode))
					return ::access(fname, X_OK) == 0;

				return false;
			}

			bool exists(const char* filename) {
				struct stat s;
				return ::stat(filename, &s) == 0;
			}

			bool is_bare(const string& name) {
				return !name.empty() && name.find('/') == string::npos;
			}

			bool lookup(const string& name, string& found, error_code& ec) {
				const char* searchpath = os::environ("PATH");
				return lookup(name, searchpath ? searchpath : "", found, ec);
			}

			bool lookup(const string& name, const string& searchpath, string& found, error_code& ec) {
				found.clear();
				ec.clear();

				if (name.empty() || searchpath.empty()) {
					ec = boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory);
					return false;
				}

				stringvec dirs;
				boost::split(dirs, searchpath, boost::is_any_of(":"));

				FOREACH(const string& dir, dirs) {
					string candidate = dir.empty() ? string(".") : dir;
					if (candidate[candidate.size()-1] != '/')
						candidate += '/';
					candidate += name;
					if (isexec(candidate)) {
						found = candidate;
						return true;
					}
				}

				ec = boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory);
				return false;
			}
		}
	}
}
