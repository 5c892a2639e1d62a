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

#include <sstream>
#include <boost/tokenizer.hpp>

namespace shellout {
	template <typename It> inline
	string join(It const& b, It const& e, const char* w = "") {
		It i = b;
		if (i == e)
			return "";

		std::stringstream ss;
		ss << *i;
		++i;
		while (i != e) {
			ss << w << *i;
			++i;
		}
		return ss.str();
	}

	inline
	stringvec split(const string& s, const string& sep = " ") {
		stringvec ret;
		typedef boost::char_separator<char> sep_t;
		typedef boost::tokenizer<sep_t> tok_t;
		sep_t sp(sep.c_str());
		tok_t tok(s, sp);
		FOREACH(const string& token, tok)
			ret.push_back(token);
		return ret;
	}

	// "KEY=VALUE" -> key, value. false if there is no '=' or the key is empty
	inline
	bool split_env(const string& entry, string& key, string& value) {
		const size_t eq = entry.find('=');
		if (eq == string::npos || eq == 0)
			return false;
		key = entry.substr(0, eq);
		value = entry.substr(eq + 1);
		return true;
	}
}
