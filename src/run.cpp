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
#include "run.hpp"
#include "shell.hpp"
#include "settings.hpp"
#include "os.hpp"
#include "stringutil.hpp"

#include <stdio.h>
#include <iostream>
#include <sstream>
#include <boost/program_options.hpp>

using namespace std;
namespace po = boost::program_options;

namespace {
	using namespace shellout;

	void usage(string const& hlp) {
		printf("shellout-run %d\n\n"                          \
		       "Usage: shellout-run [options] [--] <command> [args..]\n\n" \
		       "%s"                                           \
		       "Runs the command, relays its stdout and stderr and exits\n" \
		       "with its exit code. Exits with %d if the command is not\n" \
		       "found and %d if it could not be run.\n"       \
		       "\n", shellout::version, hlp.c_str(), ExitNotFound, ExitProcessFailed);
	}

	// sets key to value, replacing an earlier entry for the same key
	void setenv_entry(stringvec& env, const string& key, const string& entry) {
		for (size_t i = 0; i < env.size(); ++i) {
			string k, v;
			if (split_env(env[i], k, v) && k == key) {
				env[i] = entry;
				return;
			}
		}
		env.push_back(entry);
	}

	bool merge_env(stringvec& env, const stringvec& entries, const char* source) {
		FOREACH(const string& entry, entries) {
			string key, value;
			if (!split_env(entry, key, value)) {
				LOG_ERROR("Bad environment entry from %s: '%s' (expected KEY=VALUE)", source, entry.c_str());
				return false;
			}
			setenv_entry(env, key, entry);
		}
		return true;
	}
}

namespace shellout {
	int parse_commandline(int argc, char* argv[], settings& cfg, run_options& opts, string& input) {
		po::options_description generic("Generic options");
		generic.add_options()
			("version,v", "Print version string")
			("help,h", "Produce help message")
			("no-color", "Disable log color output")
			("log", po::value<string>(), "Log targets (console, syslog, file)")
			("debug,d", "Debug mode (trace logging)")
			;

		stringvec configs = shellout::split(SHELLOUT_CONFIG_FILES, ";");

		po::options_description conf("Run options");
		conf.add_options()
			("file,f", po::value<stringvec>()->default_value(configs, SHELLOUT_CONFIG_FILES), "Configuration file")
			("dir,C", po::value<string>(), "Working directory for the command")
			("env,e", po::value<stringvec>()->composing(), "Set KEY=VALUE in the command's environment")
			("input,i", po::value<string>(), "Feed file to the command's stdin (- for our stdin)")
			("summary,s", "Print exit code and output sizes to stderr");

		po::options_description hidden("Hidden options");
		hidden.add_options()
			("exec", po::value<stringvec>(), "command to execute");

		po::options_description cmdline_options("");
		cmdline_options.add(generic).add(conf).add(hidden);

		po::options_description visible("");
		visible.add(generic).add(conf);

		po::positional_options_description p;
		p.add("exec", -1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(cmdline_options).positional(p).run(), vm);
		po::notify(vm);

		if (vm.count("help")) {
			stringstream ss;
			ss << visible << endl;
			usage(ss.str());
			return -1;
		}

		if (vm.count("version")) {
			printf("shellout-run %d\n", shellout::version);
			return -1;
		}

		if (!cfg.boot(vm["file"].as<stringvec>(), false))
			return 1;

		if (vm.count("debug")) {
			cfg._loglevel = logging::Trace;
		}

		if (vm.count("log")) {
			cfg._logmodes = parse_log_targets(vm["log"].as<string>());
		}

		if (vm.count("no-color")) {
			cfg._colors = false;
		}

		cfg.apply_logging();

		if (vm.count("exec"))
			opts._argv = vm["exec"].as<stringvec>();
		if (vm.count("env"))
			opts._env = vm["env"].as<stringvec>();
		if (vm.count("dir"))
			opts._dir = vm["dir"].as<string>();
		if (vm.count("input"))
			input = vm["input"].as<string>();
		opts._summary = vm.count("summary") > 0;

		if (opts._argv.empty()) {
			fprintf(stderr, "No command specified. See -h or --help.\n");
			return 1;
		}

		return 0;
	}

	bool open_input(const string& name, std::ifstream& file, std::istream*& in) {
		if (name.empty())
			return true;
		if (name == "-") {
			in = &std::cin;
			return true;
		}
		file.open(name.c_str(), std::ios::in | std::ios::binary);
		if (!file.is_open()) {
			LOG_ERROR("Unable to open input file: %s", name.c_str());
			return false;
		}
		in = &file;
		return true;
	}

	bool make_cmd(const settings& cfg, const run_options& opts, cmd& out) {
		if (opts._argv.empty()) {
			LOG_ERROR("No command specified.");
			return false;
		}

		out = cmd(opts._argv.front());
		out._args.assign(opts._argv.begin() + 1, opts._argv.end());
		out._dir = opts._dir.size() ? opts._dir : cfg._workdir;
		out._stdin = opts._input;

		// leaving _env empty lets the child inherit everything
		if (cfg._env.empty() && opts._env.empty())
			return true;

		stringvec env;
		if (cfg._inherit_env)
			env = os::environment();
		if (!merge_env(env, cfg._env, "config"))
			return false;
		if (!merge_env(env, opts._env, "command line"))
			return false;
		out._env = env;
		return true;
	}

	int run(shell& sh, const cmd& c, bool summary, ostream& out, ostream& err) {
		error e;
		const result res = sh.run(c, e);
		if (e) {
			LOG_INFO("%s", e.message().c_str());
			err << "shellout: " << e.message() << endl;
			if (e == errc::command_not_found)
				return ExitNotFound;
			return ExitProcessFailed;
		}

		out.write(res._stdout.data(), res._stdout.size());
		out.flush();
		err.write(res._stderr.data(), res._stderr.size());
		err.flush();

		if (summary) {
			err << "shellout: " << c._command
			    << " exited with " << res._exitcode
			    << " (" << res._stdout.size() << " bytes stdout, "
			    << res._stderr.size() << " bytes stderr)" << endl;
		}

		if (res._exitcode < 0)
			return ExitSignalled;
		return res._exitcode;
	}
}
