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

#include <string>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace shellout {
	namespace errc {
		// Failure kinds reported by a shell. A command that runs and
		// exits non-zero is not a failure and has no kind here.
		enum errc_t {
			// the command could not be resolved from $PATH, nothing was started
			command_not_found = 1,
			// the process could not be started or run to completion
			command_process_failed = 2
		};
	}
}

namespace boost {
	namespace system {
		template <>
		struct is_error_code_enum<shellout::errc::errc_t> {
			static const bool value = true;
		};
	}
}

namespace shellout {
	const boost::system::error_category& shell_category();

	namespace errc {
		// found by argument dependent lookup when an errc_t converts to an error_code
		inline boost::system::error_code make_error_code(errc_t e) {
			return boost::system::error_code(static_cast<int>(e), shell_category());
		}
	}

	using errc::make_error_code;

	/*
	  error

	  The kind of failure plus the host level error that caused it.
	  Callers branch on the kind:

	    if (err == errc::command_not_found) ...

	  and look at _cause and _context for diagnostics.
	*/
	struct error {
		error();
		error(errc::errc_t kind, const boost::system::error_code& cause, const std::string& context);

		void assign(errc::errc_t kind, const boost::system::error_code& cause, const std::string& context);
		void clear();

		bool is(errc::errc_t kind) const {
			return _kind == make_error_code(kind);
		}

		explicit operator bool() const {
			return !!_kind;
		}

		// "<kind>: <context>: <cause>"
		std::string message() const;

		boost::system::error_code _kind;
		boost::system::error_code _cause;
		std::string _context;
	};

	inline bool operator==(const error& e, errc::errc_t kind) { return e.is(kind); }
	inline bool operator!=(const error& e, errc::errc_t kind) { return !e.is(kind); }

	// thrown by the throwing shell::run overload
	struct shell_error : public boost::system::system_error {
		explicit shell_error(const error& err);

		const boost::system::error_code& cause() const { return _err._cause; }
		const std::string& context() const { return _err._context; }
		const error& get() const { return _err; }

		error _err;
	};
}
