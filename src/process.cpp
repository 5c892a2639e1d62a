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
#include "process.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <istream>
#include <exception>
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace std;
using namespace boost::posix_time;

namespace {
	using shellout::error_code;

	static const size_t READ_BUFSIZE = 4096;

	enum ChildStage {
		Stage_None = 0,
		Stage_Chdir,
		Stage_Dup,
		Stage_Exec
	};

	const char* stage_name(int stage) {
		switch (stage) {
		case Stage_Chdir: return "chdir";
		case Stage_Dup: return "dup2";
		case Stage_Exec: return "exec";
		default: return "start";
		}
	}

	// written by the child to the status pipe when it fails before exec
	struct child_status {
		int stage;
		int err;
	};

	error_code errno_code(int e) {
		return error_code(e, boost::system::system_category());
	}

	void close_fd(int& fd) {
		if (fd != -1) {
			::close(fd);
			fd = -1;
		}
	}

	int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
		if (::pipe2(pfd, O_CLOEXEC) == 0)
			return 0;
#endif
		if (::pipe(pfd) != 0)
			return -1;
		::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
		::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
		return 0;
	}

	// both ends closed on scope exit unless released
	struct fdpair {
		fdpair() {
			fd[0] = -1;
			fd[1] = -1;
		}
		~fdpair() {
			close_fd(fd[0]);
			close_fd(fd[1]);
		}
		bool open() {
			return make_cloexec_pipe(fd) == 0;
		}
		int release(int i) {
			int ret = fd[i];
			fd[i] = -1;
			return ret;
		}

		int fd[2];
	};

	// Blocks SIGPIPE in the calling thread while the child is fed, so a
	// child that exits without reading its input gives EPIPE instead of
	// killing us. A SIGPIPE raised in the meantime is consumed.
	struct sigpipe_guard {
		sigpipe_guard() {
			sigemptyset(&_pipeset);
			sigaddset(&_pipeset, SIGPIPE);
			pthread_sigmask(SIG_BLOCK, &_pipeset, &_oldmask);
			_was_pending = is_pending();
		}

		~sigpipe_guard() {
			if (!_was_pending && is_pending()) {
				static const timespec zero = { 0, 0 };
				while (sigtimedwait(&_pipeset, 0, &zero) == -1 && errno == EINTR) {
				}
			}
			pthread_sigmask(SIG_SETMASK, &_oldmask, 0);
		}

		static bool is_pending() {
			sigset_t pending;
			sigemptyset(&pending);
			sigpending(&pending);
			return sigismember(&pending, SIGPIPE) == 1;
		}

		sigset_t _pipeset;
		sigset_t _oldmask;
		bool _was_pending;
	};

	// child side, async-signal-safe calls only
	void child_fail(int statusfd, int stage) {
		child_status st;
		st.stage = stage;
		st.err = errno;
		ssize_t ignored = ::write(statusfd, &st, sizeof(st));
		(void)ignored;
		_exit(127);
	}

	bool redirect(int fd, int target) {
		if (fd == target)
			return ::fcntl(fd, F_SETFD, 0) != -1;
		return ::dup2(fd, target) != -1;
	}

	void child_exec(int statusfd, const char* path, char* const* argv, char* const* envp,
	                const char* workdir, int in, int out, int err) {
		if (*workdir && ::chdir(workdir) == -1)
			child_fail(statusfd, Stage_Chdir);

		if (!redirect(in, STDIN_FILENO) ||
		    !redirect(out, STDOUT_FILENO) ||
		    !redirect(err, STDERR_FILENO))
			child_fail(statusfd, Stage_Dup);

		::execve(path, argv, envp);

		// If we got here, it means the command didn't execute
		child_fail(statusfd, Stage_Exec);
	}

	// Reads up to bufsize bytes from in. Streams with exceptions() set
	// throw at end of input as well as on failure; the stream state
	// tells them apart afterwards.
	std::streamsize read_input(std::istream& in, char* buf, size_t bufsize) {
		try {
			in.read(buf, (std::streamsize)bufsize);
		}
		catch (const std::exception& e) {
			if (in.bad())
				LOG_TRACE("Input stream failed: %s", e.what());
		}
		return in.gcount();
	}

	// appends whatever is available on fd; closes fd at end of file
	bool read_some(int& fd, string& to, char* buf, size_t bufsize, error_code& ec) {
		ssize_t amt = ::read(fd, buf, bufsize);
		if (amt > 0) {
			to.append(buf, (size_t)amt);
			return true;
		}
		if (amt == 0) {
			close_fd(fd);
			return true;
		}
		if (errno == EINTR || errno == EAGAIN)
			return true;
		ec = errno_code(errno);
		return false;
	}
}

namespace shellout {

	process::process() {
		pid = 0;
		exitcode = 0;
		termsig = 0;
		stdin_pipe = -1;
		stdout_pipe = -1;
		stderr_pipe = -1;
		_stage = 0;
		started_at = ptime(min_date_time);
	}

	process::~process() {
		close_pipes();
		if (is_active()) {
			int status = 0;
			while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
			}
			pid = 0;
		}
	}

	bool process::is_active() const {
		return pid != 0;
	}

	void process::close_pipes() {
		close_fd(stdin_pipe);
		close_fd(stdout_pipe);
		close_fd(stderr_pipe);
	}

	bool process::begin(const char* path, char* const* argv, char* const* envp,
	                    const string& workdir, bool with_stdin, error_code& ec) {
		ec.clear();
		exitcode = 0;
		termsig = 0;
		_stage = 0;

		fdpair inp, outp, errp, status;

		if (with_stdin) {
			if (!inp.open()) {
				ec = errno_code(errno);
				_stage = "pipe";
				return false;
			}
		}
		else {
			inp.fd[0] = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
			if (inp.fd[0] == -1) {
				ec = errno_code(errno);
				_stage = "open /dev/null";
				return false;
			}
		}

		if (!outp.open() || !errp.open() || !status.open()) {
			ec = errno_code(errno);
			_stage = "pipe";
			return false;
		}

		const char* wd = workdir.c_str();

		pid = ::fork();

		if (pid == 0) {
			child_exec(status.fd[1], path, argv, envp, wd, inp.fd[0], outp.fd[1], errp.fd[1]);
		}
		else if (pid == -1) {
			ec = errno_code(errno);
			_stage = "fork";
			pid = 0;
			return false;
		}

		started_at = microsec_clock::universal_time();

		// parent keeps only its own ends
		close_fd(inp.fd[0]);
		close_fd(outp.fd[1]);
		close_fd(errp.fd[1]);
		close_fd(status.fd[1]);

		// the status pipe is close-on-exec, so EOF here means exec succeeded
		child_status st;
		st.stage = Stage_None;
		st.err = 0;
		ssize_t n = 0;
		do {
			n = ::read(status.fd[0], &st, sizeof(st));
		} while (n == -1 && errno == EINTR);

		if (n == -1) {
			ec = errno_code(errno);
			_stage = "read status";
			return false;
		}

		if (n > 0) {
			int wstatus = 0;
			while (::waitpid(pid, &wstatus, 0) == -1 && errno == EINTR) {
			}
			pid = 0;
			ec = errno_code((n == (ssize_t)sizeof(st) && st.err != 0) ? st.err : EIO);
			_stage = stage_name(st.stage);
			return false;
		}

		if (with_stdin) {
			stdin_pipe = inp.release(1);
			::fcntl(stdin_pipe, F_SETFL, ::fcntl(stdin_pipe, F_GETFL) | O_NONBLOCK);
		}
		stdout_pipe = outp.release(0);
		stderr_pipe = errp.release(0);
		return true;
	}

	bool process::drain(std::istream* in, string& out, string& err, error_code& ec) {
		ec.clear();

		sigpipe_guard guard;

		char buf[READ_BUFSIZE];
		string pending; // read from in, not yet written to the child
		size_t written = 0;
		bool in_done = (in == 0);
		bool in_bad = false;

		if (in_done)
			close_fd(stdin_pipe);

		while (stdout_pipe != -1 || stderr_pipe != -1 || stdin_pipe != -1) {
			if (stdin_pipe != -1 && written == pending.size()) {
				pending.clear();
				written = 0;
				if (!in_done) {
					const std::streamsize got = read_input(*in, buf, sizeof(buf));
					if (got > 0)
						pending.assign(buf, (size_t)got);
					if (in->bad()) {
						in_bad = true;
						in_done = true;
						pending.clear();
					}
					else if (!*in) {
						in_done = true;
					}
				}
				if (pending.empty()) {
					if (in_done)
						close_fd(stdin_pipe);
					continue;
				}
			}

			pollfd fds[3];
			nfds_t nfds = 0;
			int idx_out = -1;
			int idx_err = -1;
			int idx_in = -1;

			if (stdout_pipe != -1) {
				fds[nfds].fd = stdout_pipe;
				fds[nfds].events = POLLIN;
				fds[nfds].revents = 0;
				idx_out = (int)nfds++;
			}
			if (stderr_pipe != -1) {
				fds[nfds].fd = stderr_pipe;
				fds[nfds].events = POLLIN;
				fds[nfds].revents = 0;
				idx_err = (int)nfds++;
			}
			if (stdin_pipe != -1) {
				fds[nfds].fd = stdin_pipe;
				fds[nfds].events = POLLOUT;
				fds[nfds].revents = 0;
				idx_in = (int)nfds++;
			}

			if (::poll(fds, nfds, -1) == -1) {
				if (errno == EINTR)
					continue;
				ec = errno_code(errno);
				_stage = "poll";
				close_pipes();
				return false;
			}

			if (idx_out >= 0 && fds[idx_out].revents) {
				if (!read_some(stdout_pipe, out, buf, sizeof(buf), ec)) {
					_stage = "read stdout";
					close_pipes();
					return false;
				}
			}

			if (idx_err >= 0 && fds[idx_err].revents) {
				if (!read_some(stderr_pipe, err, buf, sizeof(buf), ec)) {
					_stage = "read stderr";
					close_pipes();
					return false;
				}
			}

			if (idx_in >= 0 && fds[idx_in].revents) {
				ssize_t amt = ::write(stdin_pipe, pending.data() + written, pending.size() - written);
				if (amt >= 0) {
					written += (size_t)amt;
				}
				else if (errno == EPIPE) {
					// the child stopped reading, drop the rest of the input
					close_fd(stdin_pipe);
					in_done = true;
					pending.clear();
					written = 0;
				}
				else if (errno != EINTR && errno != EAGAIN) {
					ec = errno_code(errno);
					_stage = "write stdin";
					close_pipes();
					return false;
				}
			}
		}

		if (in_bad) {
			ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
			_stage = "read input";
			return false;
		}

		return true;
	}

	bool process::wait(error_code& ec) {
		ec.clear();

		if (!is_active())
			return true;

		int status = 0;
		pid_t ret = 0;
		do {
			ret = ::waitpid(pid, &status, 0);
		} while (ret == -1 && errno == EINTR);

		pid = 0;

		if (ret == -1) {
			ec = errno_code(errno);
			_stage = "waitpid";
			return false;
		}

		if (WIFEXITED(status)) {
			exitcode = WEXITSTATUS(status);
		}
		else if (WIFSIGNALED(status)) {
			termsig = WTERMSIG(status);
			exitcode = -1;
		}
		return true;
	}
}
