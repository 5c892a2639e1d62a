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
#include "test.hpp"
#include "error.hpp"

using std::string;
using namespace shellout;

TEST_CASE("error/category", "the two kinds are error_codes in their own category") {
	error_code nf = make_error_code(errc::command_not_found);
	error_code pf = errc::command_process_failed;

	REQUIRE(string(shell_category().name()) == "shellout");
	REQUIRE(nf.category() == shell_category());
	REQUIRE(nf.message() == "command not found");
	REQUIRE(pf.message() == "command process failed");
	REQUIRE(nf != pf);
	REQUIRE(nf == errc::command_not_found);
}

TEST_CASE("error/basic", "an empty error is no error") {
	error err;
	REQUIRE(!err);
	REQUIRE(!err.is(errc::command_not_found));
	REQUIRE(!err.is(errc::command_process_failed));
	REQUIRE(err.message() == "success");

	err.assign(errc::command_process_failed,
	           boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory),
	           "chdir \"/nowhere\"");
	REQUIRE(err);
	REQUIRE(err == errc::command_process_failed);
	REQUIRE(err != errc::command_not_found);
	REQUIRE(err._cause == boost::system::errc::no_such_file_or_directory);
	REQUIRE(err.message() == "command process failed: chdir \"/nowhere\": " + err._cause.message());

	err.clear();
	REQUIRE(!err);
	REQUIRE(err._context.empty());
	REQUIRE(!err._cause);
}

TEST_CASE("error/shell_error", "the exception carries kind, cause and context") {
	const error err(errc::command_not_found,
	                boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory),
	                "lookup \"nope\"");

	try {
		throw shell_error(err);
	}
	catch (const boost::system::system_error& e) {
		REQUIRE(e.code() == errc::command_not_found);
		REQUIRE(string(e.what()).find("lookup \"nope\"") != string::npos);
		REQUIRE(string(e.what()).find("command not found") != string::npos);

		const shell_error* se = dynamic_cast<const shell_error*>(&e);
		REQUIRE(se != 0);
		REQUIRE(se->cause() == boost::system::errc::no_such_file_or_directory);
		REQUIRE(se->context() == "lookup \"nope\"");
		REQUIRE(se->get() == errc::command_not_found);
	}
}
