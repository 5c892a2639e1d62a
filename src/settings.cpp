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
#include "settings.hpp"
#include "os.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/info_parser.hpp>
#include <boost/optional.hpp>
#include "stringutil.hpp"

using namespace std;
using namespace boost;

namespace shellout {
	int parse_log_targets(const string& targets) {
		int modes = 0;
		if (targets.find("syslog") != string::npos)
			modes |= logging::LogToSyslog;
		if (targets.find("console") != string::npos)
			modes |= logging::LogToConsole;
		if (targets.find("file") != string::npos)
			modes |= logging::LogToFile;
		return modes;
	}

	settings::settings() :
		_loglevel(logging::Warn),
		_logmodes(logging::LogToConsole),
		_logfile(SHELLOUT_LOG_FILE),
		_colors(true),

		_workdir(),
		_inherit_env(true),
		_env(),
		_loaded() {
	}

	bool settings::read_config(const stringvec& configs, bool verbose) {
		using namespace property_tree;
		ptree pt;

		_loaded.clear();

		FOREACH(const string& fname, configs) {
			if (!os::path::exists(fname))
				continue;
			try {
				info_parser::read_info(fname, pt);
				_loaded.push_back(fname);
			}
			catch (const ptree_error& e) {
				LOG_ERROR("Configuration error: %s", e.what());
				return false;
			}
			// first one found wins, later entries are fallbacks
			break;
		}

		if (_loaded.empty() && verbose) {
			LOG_TRACE("No config file found in: %s", join(configs.begin(), configs.end(), ", ").c_str());
		}

		try {
			{
				const string level = pt.get<string>("log.level", logging::level_to_string(_loglevel));
				if (!logging::parse_level(level.c_str(), _loglevel)) {
					LOG_ERROR("Configuration error: unknown log level '%s'", level.c_str());
					return false;
				}
			}

			optional<string> targets = pt.get_optional<string>("log.targets");
			if (targets) {
				_logmodes = parse_log_targets(*targets);
				if (_logmodes == 0 && targets->size()) {
					LOG_ERROR("Configuration error: unknown log targets '%s'", targets->c_str());
					return false;
				}
			}

			_logfile = pt.get<string>("log.file", _logfile);
			_colors = pt.get<bool>("log.colors", _colors);

			_workdir = pt.get<string>("run.workdir", _workdir);
			_inherit_env = pt.get<bool>("run.inherit_env", _inherit_env);

			optional<ptree&> env = pt.get_child_optional("run.env");
			if (env) {
				_env.clear();
				FOREACH(const ptree::value_type& v, *env) {
					if (v.first.empty() || v.first.find('=') != string::npos) {
						LOG_ERROR("Configuration error: bad environment variable name '%s'", v.first.c_str());
						return false;
					}
					_env.push_back(v.first + "=" + v.second.get_value<string>());
				}
			}
		}
		catch (const ptree_error& e) {
			LOG_ERROR("Configuration error: %s", e.what());
			return false;
		}

		return true;
	}

	void settings::apply_logging() const {
		logging::set_log_level(_loglevel);
		logging::set_log_file(_logfile.c_str());
		logging::set_log_mode(_logmodes);
		logging::colors = _colors;
	}

	bool settings::boot(const stringvec& configs, bool verbose) {
		if (!read_config(configs, verbose)) {
			LOG_ERROR("Failed to read config, terminating.");
			return false;
		}

		apply_logging();

		if (verbose) {
			FOREACH(const string& fname, _loaded)
				LOG_INFO("Config: %s", fname.c_str());
			LOG_INFO("Log level: %s", logging::level_to_string(_loglevel));
			if (_workdir.size())
				LOG_INFO("Working directory: %s", _workdir.c_str());
		}
		return true;
	}
}
