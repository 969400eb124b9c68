// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ChildProcess.hxx"
#include "Cancel.hxx"
#include "Error.hxx"
#include "UniqueFd.hxx"
#include "Log.hxx"

#include <algorithm>
#include <array>
#include <optional>
#include <stdexcept>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

/**
 * How often the cancellation flag is checked while waiting for
 * output.
 */
static constexpr std::chrono::milliseconds POLL_INTERVAL{100};

[[gnu::pure]]
static std::string_view
GetVariableName(std::string_view entry) noexcept
{
	return entry.substr(0, entry.find('='));
}

[[gnu::pure]]
static bool
Contains(const std::vector<std::string> &list, std::string_view name) noexcept
{
	return std::find(list.begin(), list.end(), name) != list.end();
}

[[gnu::pure]]
static bool
IsOverridden(const std::vector<std::string> &setenv,
	     std::string_view name) noexcept
{
	return std::any_of(setenv.begin(), setenv.end(), [name](const auto &i){
		return GetVariableName(i) == name;
	});
}

static std::vector<const char *>
BuildEnvironment(const ChildProcessOptions &options)
{
	std::vector<const char *> envp;

	for (char **i = environ; *i != nullptr; ++i) {
		const auto name = GetVariableName(*i);
		if (!Contains(options.unsetenv, name) &&
		    !IsOverridden(options.setenv, name))
			envp.push_back(*i);
	}

	for (const auto &i : options.setenv)
		envp.push_back(i.c_str());

	envp.push_back(nullptr);
	return envp;
}

static std::vector<const char *>
BuildArgv(const ChildProcessOptions &options)
{
	std::vector<const char *> argv;
	argv.reserve(options.args.size() + 1);
	for (const auto &i : options.args)
		argv.push_back(i.c_str());
	argv.push_back(nullptr);
	return argv;
}

/**
 * Runs in the forked child; only async-signal-safe calls allowed.
 */
[[noreturn]]
static void
ExecChild(int null_fd, int stdout_fd,
	  const char *const*argv, const char *const*envp) noexcept
{
	/* new session: no controlling terminal, so /dev/tty
	   cannot be opened for a passphrase prompt */
	setsid();

	/* ignored in the parent; ignored dispositions survive
	   execve() */
	struct sigaction sa{};
	sa.sa_handler = SIG_DFL;
	sigaction(SIGPIPE, &sa, nullptr);

	if (dup2(null_fd, STDIN_FILENO) < 0 ||
	    dup2(stdout_fd, STDOUT_FILENO) < 0 ||
	    dup2(null_fd, STDERR_FILENO) < 0)
		_exit(127);

	execve(argv[0], const_cast<char *const*>(argv),
	       const_cast<char *const*>(envp));
	_exit(127);
}

static int
DecodeWaitStatus(int status) noexcept
{
	return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static int
WaitChild(pid_t pid) noexcept
{
	int status;
	while (waitpid(pid, &status, 0) < 0)
		if (errno != EINTR)
			return -1;

	return DecodeWaitStatus(status);
}

/**
 * Wait for the child to exit, but not beyond the deadline and not
 * after cancellation was requested.
 *
 * @return the exit status or std::nullopt if the child is still
 * running
 */
static std::optional<int>
WaitChildUntil(pid_t pid,
	       std::chrono::steady_clock::time_point deadline) noexcept
{
	while (!IsCancelRequested() &&
	       std::chrono::steady_clock::now() < deadline) {
		int status;
		const pid_t result = waitpid(pid, &status, WNOHANG);
		if (result == pid)
			return DecodeWaitStatus(status);

		if (result < 0 && errno != EINTR)
			return -1;

		usleep(10000);
	}

	return std::nullopt;
}

ChildProcessResult
RunChildProcess(const ChildProcessOptions &options)
{
	if (options.args.empty())
		throw std::invalid_argument{"No program"};

	const auto argv = BuildArgv(options);
	const auto envp = BuildEnvironment(options);

	UniqueFd null_fd{open("/dev/null", O_RDWR|O_NOCTTY|O_CLOEXEC)};
	if (!null_fd.IsDefined())
		throw MakeResourceError("Failed to open /dev/null");

	int pipe_fds[2];
	if (pipe2(pipe_fds, O_CLOEXEC) < 0)
		throw MakeResourceError("pipe() failed");

	UniqueFd read_fd{pipe_fds[0]}, write_fd{pipe_fds[1]};

	LogFmt(3, "Running {}", options.args.front());

	const pid_t pid = fork();
	if (pid < 0)
		throw MakeResourceError("fork() failed");

	if (pid == 0)
		ExecChild(null_fd.Get(), write_fd.Get(), argv.data(), envp.data());

	write_fd.Close();
	null_fd.Close();

	ChildProcessResult result;

	const auto deadline = std::chrono::steady_clock::now() + options.timeout;

	std::array<char, 4096> buffer;

	while (true) {
		if (IsCancelRequested()) {
			result.cancelled = true;
			break;
		}

		const auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			result.timed_out = true;
			break;
		}

		const auto remaining =
			std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
		const auto wait = std::min(POLL_INTERVAL, remaining);

		struct pollfd pfd{.fd = read_fd.Get(), .events = POLLIN, .revents = 0};
		const int n = poll(&pfd, 1, static_cast<int>(wait.count()));
		if (n < 0) {
			if (errno == EINTR)
				continue;

			/* should not happen; treat like a hang */
			result.timed_out = true;
			break;
		}

		if (n == 0)
			continue;

		const auto nbytes = read(read_fd.Get(), buffer.data(), buffer.size());
		if (nbytes < 0) {
			if (errno == EINTR || errno == EAGAIN)
				continue;
			break;
		}

		if (nbytes == 0)
			/* end of file: the child has closed its
			   standard output */
			break;

		const std::size_t room = result.output.size() < options.max_output
			? options.max_output - result.output.size()
			: 0;
		result.output.append(buffer.data(),
				     std::min(room, static_cast<std::size_t>(nbytes)));
	}

	if (!result.timed_out && !result.cancelled) {
		/* standard output was closed; the process should
		   exit right away */
		if (const auto status = WaitChildUntil(pid, deadline)) {
			result.exit_status = *status;
			return result;
		}

		if (IsCancelRequested())
			result.cancelled = true;
		else
			result.timed_out = true;
	}

	LogFmt(2, "Killing {} (pid {})", options.args.front(), pid);
	kill(-pid, SIGKILL);
	kill(pid, SIGKILL);
	WaitChild(pid);

	result.output.clear();
	result.exit_status = -1;
	return result;
}
