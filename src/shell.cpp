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
#include "shell.hpp"
#include "process.hpp"
#include "os.hpp"
#include "stringutil.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

extern char** environ;

using namespace std;
using namespace boost::posix_time;

namespace {
	using namespace shellout;
	using shellout::error_code;

	// pointers into strs, null terminated; strs must outlive the result
	vector<char*> cstrings(const stringvec& strs) {
		vector<char*> ret;
		ret.reserve(strs.size() + 1);
		FOREACH(const string& s, strs)
			ret.push_back(const_cast<char*>(s.c_str()));
		ret.push_back(0);
		return ret;
	}

	string describe(const char* stage, const cmd& c, const string& path) {
		const string s(stage ? stage : "start");
		if (s == "chdir")
			return s + " \"" + c._dir + "\"";
		if (s == "exec")
			return s + " \"" + path + "\"";
		return s;
	}

	result fail(error& err, const error_code& ec, const string& context) {
		err.assign(shellout::errc::command_process_failed, ec, context);
		LOG_TRACE("%s", err.message().c_str());
		return result();
	}
}

namespace shellout {
	result shell::run(const cmd& c) {
		error err;
		result res = run(c, err);
		if (err)
			throw shell_error(err);
		return res;
	}

	result posix_shell::run(const cmd& c, error& err) {
		err.clear();

		if (c._command.empty())
			return fail(err, boost::system::errc::make_error_code(boost::system::errc::invalid_argument), "no command");

		string path(c._command);
		if (os::path::is_bare(c._command)) {
			error_code ec;
			if (!os::path::lookup(c._command, path, ec)) {
				err.assign(errc::command_not_found, ec, "lookup \"" + c._command + "\"");
				LOG_TRACE("%s", err.message().c_str());
				return result();
			}
		}

		stringvec args;
		args.reserve(c._args.size() + 1);
		args.push_back(c._command);
		args.insert(args.end(), c._args.begin(), c._args.end());
		const vector<char*> argv = cstrings(args);

		vector<char*> env;
		if (!c._env.empty())
			env = cstrings(c._env);
		char* const* envp = env.empty() ? ::environ : &env[0];

		if (c._dir.empty())
			LOG_TRACE("Executing: %s", to_string(c).c_str());
		else
			LOG_TRACE("Executing: %s (in %s)", to_string(c).c_str(), c._dir.c_str());

		process p;
		error_code ec;
		if (!p.begin(path.c_str(), &argv[0], envp, c._dir, c._stdin != 0, ec))
			return fail(err, ec, describe(p._stage, c, path));

		result res;
		if (!p.drain(c._stdin, res._stdout, res._stderr, ec)) {
			const string context = describe(p._stage, c, path);
			p.close_pipes();
			error_code wec;
			if (!p.wait(wec))
				LOG_WARN("Failed to reap %s: %s", path.c_str(), wec.message().c_str());
			return fail(err, ec, context);
		}

		if (!p.wait(ec))
			return fail(err, ec, describe(p._stage, c, path));

		res._exitcode = p.exitcode;

		const time_duration elapsed = microsec_clock::universal_time() - p.started_at;
		if (p.termsig != 0) {
			LOG_TRACE("%s: killed by signal %d (time: %s)", c._command.c_str(), p.termsig,
			          to_simple_string(elapsed).c_str());
		}
		else {
			LOG_TRACE("%s: exited with %d, %u bytes stdout, %u bytes stderr (time: %s)",
			          c._command.c_str(), res._exitcode,
			          (unsigned)res._stdout.size(), (unsigned)res._stderr.size(),
			          to_simple_string(elapsed).c_str());
		}
		return res;
	}

	shell& default_shell() {
		static posix_shell instance;
		return instance;
	}

	shell_ptr new_shell() {
		return shell_ptr(new posix_shell);
	}

	result run(const cmd& c, error& err) {
		return default_shell().run(c, err);
	}

	result run(const cmd& c) {
		return default_shell().run(c);
	}

	string to_string(const cmd& c) {
		if (c._args.empty())
			return c._command;
		return c._command + " " + join(c._args.begin(), c._args.end(), " ");
	}
}
