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
#include "error.hpp"

namespace {
	struct shell_category_impl : public boost::system::error_category {
		shell_category_impl() {}

		virtual const char* name() const BOOST_NOEXCEPT {
			return "shellout";
		}

		virtual std::string message(int ev) const {
			switch (ev) {
			case shellout::errc::command_not_found: return "command not found";
			case shellout::errc::command_process_failed: return "command process failed";
			default: return "unknown shellout error";
			}
		}
	};
}

namespace shellout {
	const boost::system::error_category& shell_category() {
		static const shell_category_impl instance;
		return instance;
	}

	error::error() {
	}

	error::error(errc::errc_t kind, const error_code& cause, const string& context)
		: _kind(make_error_code(kind)),
		  _cause(cause),
		  _context(context) {
	}

	void error::assign(errc::errc_t kind, const error_code& cause, const string& context) {
		_kind = make_error_code(kind);
		_cause = cause;
		_context = context;
	}

	void error::clear() {
		_kind.clear();
		_cause.clear();
		_context.clear();
	}

	string error::message() const {
		if (!_kind)
			return "success";
		string ret = _kind.message();
		if (_context.size())
			ret += ": " + _context;
		if (_cause)
			ret += ": " + _cause.message();
		return ret;
	}

	shell_error::shell_error(const error& err)
		: boost::system::system_error(err._kind, err._context.size() ? err._context + ": " + err._cause.message() : err._cause.message()),
		  _err(err) {
	}
}
