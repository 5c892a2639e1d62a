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

#include <stdarg.h>
#include <stdio.h>
#include <strings.h>
#include <syslog.h>
#include <time.h>
#include <unistd.h>
#include <pthread.h>

namespace {
	bool _syslog_open = false;
	FILE* _logfile = 0;
	std::string _logfile_name(SHELLOUT_LOG_FILE);

	void syslog_stop() {
		if (_syslog_open) {
			closelog();
			_syslog_open = false;
		}
	}

	void syslog_write(int priority, const char* str, va_list arglist) {
		if (!_syslog_open) {
			openlog("shellout", LOG_CONS, LOG_USER);
			_syslog_open = true;
		}
		::vsyslog(priority, str, arglist);
	}

	void logfile_close() {
		if (_logfile) {
			fclose(_logfile);
			_logfile = 0;
		}
	}

	void logfile_atexit() {
		logfile_close();
	}

	void logfile_write(const char* fil, int lin, const char* str, va_list arglist) {
		if (!_logfile) {
			static bool registered = false;
			_logfile = fopen(_logfile_name.c_str(), "a");
			if (!registered) {
				atexit(logfile_atexit);
				registered = true;
			}
		}
		if (_logfile) {
			fprintf(_logfile, "%s(%d): ", fil, lin);
			vfprintf(_logfile, str, arglist);
			fprintf(_logfile, "\n");
			fflush(_logfile);
		}
	}

	const char* timenowstring(char* buf) {
		time_t t;
		struct tm tid;
		::time(&t);
		::localtime_r(&t, &tid);
		strftime(buf, 30, "%x %X", &tid);
		return buf;
	}

	struct level_info {
		const char* name;
		int priority; // syslog
		int color; // 0 = no color
	};

	const level_info levels[] = {
		{ "trace", LOG_DEBUG, shellout::logging::CYAN },
		{ "info", LOG_INFO, 0 },
		{ "warn", LOG_WARNING, shellout::logging::YELLOW },
		{ "error", LOG_ERR, shellout::logging::RED }
	};
}

namespace shellout {
	namespace logging {
		bool colors = true;
		int modeflags = LogToConsole;
		LogLevels loglevel = Warn;

		pthread_mutex_t _log_mutex = PTHREAD_MUTEX_INITIALIZER;

		struct log_lock {
			log_lock() {
				pthread_mutex_lock(&_log_mutex);
			}
			~log_lock() {
				pthread_mutex_unlock(&_log_mutex);
			}
		};

		void set_log_mode(int flags) {
			log_lock ll;
			modeflags = flags;
			if (!(modeflags & LogToSyslog)) {
				syslog_stop();
			}
			if (!(modeflags & LogToFile)) {
				logfile_close();
			}
		}

		int log_mode() {
			return modeflags;
		}

		void set_log_level(LogLevels level) {
			loglevel = level;
		}

		LogLevels log_level() {
			return loglevel;
		}

		void set_log_file(const char* path) {
			log_lock ll;
			if (_logfile_name != path) {
				logfile_close();
				_logfile_name = path;
			}
		}

		bool parse_level(const char* name, LogLevels& level) {
			for (size_t i = 0; i < ASIZE(levels); ++i) {
				if (strcasecmp(name, levels[i].name) == 0) {
					level = (LogLevels)i;
					return true;
				}
			}
			return false;
		}

		const char* level_to_string(LogLevels level) {
			if (level >= 0 && level < (int)ASIZE(levels))
				return levels[level].name;
			return "unknown";
		}

		log_context::log_context(const char* fil, int lin, const char* fun) : _file(fil), _line(lin), _fun(fun) {
			static const char* prefixes[] = {
				"../src/",
				"src/"
			};
			for (size_t i = 0; i < ASIZE(prefixes); ++i)
				if (strncmp(_file, prefixes[i], strlen(prefixes[i])) == 0)
					_file += strlen(prefixes[i]);
			// absolute paths from out-of-tree builds
			const char* src = strstr(_file, "/src/");
			if (src)
				_file = src + 5;
		}

		void log_context::_write(LogLevels level, const char* fmt, va_list arglist) {
			log_lock ll;

			const level_info& li = levels[level];

			if (modeflags & LogToSyslog) {
				va_list va_args;
				va_copy(va_args, arglist);
				syslog_write(li.priority, fmt, va_args);
				va_end(va_args);
			}

			// console output goes to stderr, stdout belongs to the relayed command
			if (modeflags & LogToConsole) {
				char tmp[2048];
				va_list va_args;
				va_copy(va_args, arglist);
				vsnprintf(tmp, sizeof(tmp), fmt, va_args);
				va_end(va_args);

				char tbuf[30];
				if (colors && li.color)
					fprintf(stderr, "\e[%dm%s %s(%d): %s\e[0m\n", li.color, timenowstring(tbuf), _file, _line, tmp);
				else
					fprintf(stderr, "%s %s(%d): %s\n", timenowstring(tbuf), _file, _line, tmp);

				fflush(stderr);
			}

			if (modeflags & LogToFile) {
				va_list va_args;
				va_copy(va_args, arglist);
				logfile_write(_file, _line, fmt, va_args);
				va_end(va_args);
			}
		}

		void log_context::trace(const char* fmt, ...) {
			if (loglevel > Trace)
				return;
			va_list va_args;
			va_start(va_args, fmt);
			_write(Trace, fmt, va_args);
			va_end(va_args);
		}

		void log_context::info(const char* fmt, ...) {
			if (loglevel > Info)
				return;
			va_list va_args;
			va_start(va_args, fmt);
			_write(Info, fmt, va_args);
			va_end(va_args);
		}

		void log_context::warn(const char* fmt, ...) {
			if (loglevel > Warn)
				return;
			va_list va_args;
			va_start(va_args, fmt);
			_write(Warn, fmt, va_args);
			va_end(va_args);
		}

		void log_context::error(const char* fmt, ...) {
			va_list va_args;
			va_start(va_args, fmt);
			_write(Error, fmt, va_args);
			va_end(va_args);
		}
	}
}
