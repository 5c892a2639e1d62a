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
#include "shell.hpp"
#include "os.hpp"

#include <sstream>
#include <streambuf>
#include <stdexcept>
#include <pthread.h>
#include <boost/algorithm/string/trim.hpp>

using std::string;
using std::istringstream;
using namespace shellout;
using boost::algorithm::trim_copy;

namespace {
	const char* missing_command = "icantbelievethisisacommandinyourenvironment";

	cmd sh(const string& script) {
		cmd c("/bin/sh");
		c._args << "-c" << script.c_str();
		return c;
	}

	string all_bytes(size_t len) {
		string ret;
		ret.reserve(len);
		for (size_t i = 0; i < len; ++i)
			ret.push_back((char)(i % 256));
		return ret;
	}

	// stream buffer that fails on the first read
	struct failing_buf : public std::streambuf {
		virtual int_type underflow() {
			throw std::runtime_error("input device went away");
		}
	};

	struct echo_job {
		string _tag;
		result _res;
		error _err;
	};

	extern "C" void* run_echo_job(void* p) {
		echo_job* job = static_cast<echo_job*>(p);
		cmd c = sh("sleep 0.2; echo $TAG; echo $TAG 1>&2");
		c._env << ("TAG=" + job->_tag).c_str();
		job->_res = shellout::run(c, job->_err);
		return 0;
	}
}

TEST_CASE("shell/not_found", "a command that is not on $PATH is command_not_found") {
	string found;
	error_code ec;
	REQUIRE(!os::path::lookup(missing_command, found, ec));

	error err;
	result res = shellout::run(cmd(missing_command), err);
	REQUIRE(err == errc::command_not_found);
	REQUIRE(!err.is(errc::command_process_failed));
	REQUIRE(err._cause == boost::system::errc::no_such_file_or_directory);
	REQUIRE(res._exitcode == 0);
	REQUIRE(res._stdout.empty());
	REQUIRE(res._stderr.empty());
}

TEST_CASE("shell/empty_command", "an empty cmd is command_process_failed") {
	error err;
	result res = shellout::run(cmd(), err);
	REQUIRE(err == errc::command_process_failed);
	REQUIRE(err._cause == boost::system::errc::invalid_argument);
	REQUIRE(res._exitcode == 0);
	REQUIRE(res._stdout.empty());
}

TEST_CASE("shell/stdout", "captures stdout") {
	error err;
	result res = shellout::run(sh("echo passed"), err);
	REQUIRE(!err);
	REQUIRE(trim_copy(res._stdout) == "passed");
	REQUIRE(res._stderr.empty());
	REQUIRE(res._exitcode == 0);
}

TEST_CASE("shell/stderr", "captures stderr") {
	error err;
	result res = shellout::run(sh("1>&2 echo passed"), err);
	REQUIRE(!err);
	REQUIRE(trim_copy(res._stderr) == "passed");
	REQUIRE(res._stdout.empty());
}

TEST_CASE("shell/separate_streams", "stdout and stderr are never merged") {
	error err;
	result res = shellout::run(sh("echo out1; echo err1 1>&2; echo out2; echo err2 1>&2"), err);
	REQUIRE(!err);
	REQUIRE(res._stdout == "out1\nout2\n");
	REQUIRE(res._stderr == "err1\nerr2\n");
}

TEST_CASE("shell/exitcode", "non-zero exit is data, not an error") {
	error err;
	result res = shellout::run(sh("exit 17"), err);
	REQUIRE(!err);
	REQUIRE(res._exitcode == 17);

	res = shellout::run(sh("echo partial; exit 1"), err);
	REQUIRE(!err);
	REQUIRE(res._exitcode == 1);
	REQUIRE(res._stdout == "partial\n");
}

TEST_CASE("shell/lookup", "bare names are resolved through $PATH") {
	cmd c("sh");
	c._args << "-c" << "exit 5";
	error err;
	result res = shellout::run(c, err);
	REQUIRE(!err);
	REQUIRE(res._exitcode == 5);
}

TEST_CASE("shell/signalled", "a child killed by a signal still ran") {
	error err;
	result res = shellout::run(sh("echo before; kill -9 $$"), err);
	REQUIRE(!err);
	REQUIRE(res._exitcode == -1);
	REQUIRE(res._stdout == "before\n");
}

TEST_CASE("shell/env", "the child sees the given environment only") {
	cmd c = sh("echo $RESULT; echo ${SHELLOUT_TEST_INHERIT:-unset}");
	c._env << "RESULT=passed";

	REQUIRE(setenv("SHELLOUT_TEST_INHERIT", "inherited", 1) == 0);

	error err;
	result res = shellout::run(c, err);
	REQUIRE(!err);
	REQUIRE(res._stdout == "passed\nunset\n");

	unsetenv("SHELLOUT_TEST_INHERIT");
}

TEST_CASE("shell/env_inherit", "an empty environment inherits the caller's") {
	REQUIRE(setenv("SHELLOUT_TEST_INHERIT", "inherited", 1) == 0);

	error err;
	result res = shellout::run(sh("echo ${SHELLOUT_TEST_INHERIT:-unset}"), err);
	REQUIRE(!err);
	REQUIRE(trim_copy(res._stdout) == "inherited");

	unsetenv("SHELLOUT_TEST_INHERIT");
}

TEST_CASE("shell/stdin", "stdin is delivered verbatim") {
	const string expected = slurp("testdata/dir.txt");
	REQUIRE(expected.size() > 0);

	istringstream in(expected);
	cmd c = sh("cat");
	c._stdin = &in;

	error err;
	result res = shellout::run(c, err);
	REQUIRE(!err);
	REQUIRE(res._stdout == expected);
}

TEST_CASE("shell/stdin_binary", "binary input larger than a pipe buffer round trips through cat") {
	const string expected = all_bytes(512*1024 + 17);
	istringstream in(expected);
	cmd c = sh("cat");
	c._stdin = &in;

	error err;
	result res = shellout::run(c, err);
	REQUIRE(!err);
	REQUIRE(res._exitcode == 0);
	REQUIRE(res._stdout.size() == expected.size());
	REQUIRE(res._stdout == expected);
}

TEST_CASE("shell/stdin_exceptions", "streams that throw at end of input are read to the end") {
	istringstream in("abc");
	in.exceptions(std::ios::failbit | std::ios::badbit);
	cmd c = sh("cat");
	c._stdin = &in;

	error err;
	result res;
	REQUIRE_NOTHROW(res = shellout::run(c, err));
	REQUIRE(!err);
	REQUIRE(res._stdout == "abc");
}

TEST_CASE("shell/stdin_failure", "a failing input stream is command_process_failed") {
	failing_buf quiet_buf;
	std::istream quiet(&quiet_buf);
	cmd c = sh("cat");
	c._stdin = &quiet;

	error err;
	result res = shellout::run(c, err);
	REQUIRE(err == errc::command_process_failed);
	REQUIRE(err._cause == boost::system::errc::io_error);
	REQUIRE(err._context == "read input");
	REQUIRE(res._stdout.empty());

	failing_buf loud_buf;
	std::istream loud(&loud_buf);
	loud.exceptions(std::ios::badbit);
	c._stdin = &loud;

	REQUIRE_NOTHROW(res = shellout::run(c, err));
	REQUIRE(err == errc::command_process_failed);
	REQUIRE(err._context == "read input");
}

TEST_CASE("shell/stdin_absent", "without a stream the child reads /dev/null") {
	error err;
	result res = shellout::run(sh("wc -c"), err);
	REQUIRE(!err);
	REQUIRE(trim_copy(res._stdout) == "0");
}

TEST_CASE("shell/stdin_ignored", "a child that exits without reading its input is not a failure") {
	const string input = all_bytes(1024*1024);
	istringstream in(input);
	cmd c = sh("exit 3");
	c._stdin = &in;

	error err;
	result res = shellout::run(c, err);
	REQUIRE(!err);
	REQUIRE(res._exitcode == 3);
}

TEST_CASE("shell/large_output", "both streams are drained at the same time") {
	error err;
	result res = shellout::run(sh("head -c 300000 /dev/zero; head -c 200000 /dev/zero 1>&2; head -c 100000 /dev/zero"), err);
	REQUIRE(!err);
	REQUIRE(res._stdout.size() == 400000);
	REQUIRE(res._stderr.size() == 200000);
	REQUIRE(res._stdout.find_first_not_of('\0') == string::npos);
}

TEST_CASE("shell/dir", "the child runs in the given directory") {
	const string expected = slurp("testdata/dir.txt");
	REQUIRE(expected.size() > 0);

	cmd c = sh("cat dir.txt");
	c._dir = "testdata";

	error err;
	result res = shellout::run(c, err);
	REQUIRE(!err);
	REQUIRE(res._stdout == expected);
}

TEST_CASE("shell/bad_dir", "a missing working directory is command_process_failed") {
	cmd c = sh("echo never");
	c._dir = "/thisishopefullynotarealdirectory";

	error err;
	result res = shellout::run(c, err);
	REQUIRE(err == errc::command_process_failed);
	REQUIRE(err._cause == boost::system::errc::no_such_file_or_directory);
	REQUIRE(err._context.find("chdir") != string::npos);
	REQUIRE(res._stdout.empty());
}

TEST_CASE("shell/explicit_path", "explicit paths skip lookup, failures come from exec") {
	error err;
	shellout::run(cmd("/thisishopefullynotarealdirectory/bin/thing"), err);
	REQUIRE(err == errc::command_process_failed);
	REQUIRE(err._cause == boost::system::errc::no_such_file_or_directory);
	REQUIRE(err._context.find("exec") != string::npos);

	// a plain file without execute bits
	shellout::run(cmd("testdata/dir.txt"), err);
	REQUIRE(err == errc::command_process_failed);
	REQUIRE(err._cause == boost::system::errc::permission_denied);

	cmd c("/bin/sh");
	c._args << "-c" << "exit 0";
	shellout::run(c, err);
	REQUIRE(!err);
}

TEST_CASE("shell/throwing", "the throwing overload raises shell_error") {
	REQUIRE_THROWS_AS(shellout::run(cmd(missing_command)), shell_error);

	try {
		shellout::run(cmd());
		FAIL("expected shell_error");
	}
	catch (const shell_error& e) {
		REQUIRE(e.code() == errc::command_process_failed);
		REQUIRE(e.cause() == boost::system::errc::invalid_argument);
		REQUIRE(e.context() == "no command");
	}

	result res = shellout::run(sh("exit 4"));
	REQUIRE(res._exitcode == 4);
}

TEST_CASE("shell/instances", "default_shell and new_shell are interchangeable") {
	shell_ptr s = new_shell();
	REQUIRE(s);

	error err;
	result a = s->run(sh("echo same"), err);
	REQUIRE(!err);
	result b = default_shell().run(sh("echo same"), err);
	REQUIRE(!err);
	REQUIRE(a._stdout == b._stdout);
	REQUIRE(&default_shell() == &default_shell());
}

TEST_CASE("shell/concurrent", "concurrent runs only see their own output") {
	echo_job jobs[4];
	pthread_t threads[4];
	for (size_t i = 0; i < ASIZE(jobs); ++i) {
		jobs[i]._tag = "job" + string(1, (char)('a' + i));
		REQUIRE(pthread_create(&threads[i], 0, &run_echo_job, &jobs[i]) == 0);
	}
	for (size_t i = 0; i < ASIZE(jobs); ++i)
		REQUIRE(pthread_join(threads[i], 0) == 0);

	for (size_t i = 0; i < ASIZE(jobs); ++i) {
		REQUIRE(!jobs[i]._err);
		REQUIRE(jobs[i]._res._exitcode == 0);
		REQUIRE(jobs[i]._res._stdout == jobs[i]._tag + "\n");
		REQUIRE(jobs[i]._res._stderr == jobs[i]._tag + "\n");
	}
}

TEST_CASE("shell/to_string", "command line for logging") {
	REQUIRE(to_string(sh("exit 1")) == "/bin/sh -c exit 1");
	REQUIRE(to_string(cmd("true")) == "true");
}
