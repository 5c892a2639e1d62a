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
	namespace os {
		const char* environ(const char* var);

		// copy of the calling process's environment as KEY=VALUE entries
		stringvec environment();

		namespace path {
			// regular file we are allowed to execute
			bool isexec(const char* fname);
			bool exists(const char* filename);

			// true if name should go through $PATH lookup, ie it is
			// a bare name without any slashes
			bool is_bare(const string& name);

			// Search the directories in $PATH for an executable
			// named name. An empty entry in $PATH means the
			// current directory. On failure ec is set to
			// no_such_file_or_directory.
			bool lookup(const string& name, string& found, error_code& ec);

			// same, with an explicit search path instead of $PATH
			bool lookup(const string& name, const string& searchpath, string& found, error_code& ec);

			inline bool isexec(const string& fname) { return isexec(fname.c_str()); }
			inline bool exists(const string& filename) { return exists(filename.c_str()); }
		}
	}
}
