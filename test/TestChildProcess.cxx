// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "system/ChildProcess.hxx"
#include "system/Cancel.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

#include <stdlib.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static ChildProcessResult
RunShell(const char *script,
	 std::chrono::milliseconds timeout=std::chrono::seconds{10})
{
	ChildProcessOptions options;
	options.args = {"/bin/sh", "-c", script};
	options.timeout = timeout;
	return RunChildProcess(options);
}

TEST(ChildProcess, Output)
{
	const auto result = RunShell("echo hello; echo world");
	EXPECT_TRUE(result.Succeeded());
	EXPECT_FALSE(result.timed_out);
	EXPECT_FALSE(result.cancelled);
	EXPECT_EQ(result.output, "hello\nworld\n"sv);
}

TEST(ChildProcess, ExitStatus)
{
	const auto result = RunShell("echo partial; exit 3");
	EXPECT_FALSE(result.Succeeded());
	EXPECT_EQ(result.exit_status, 3);
	EXPECT_EQ(result.output, "partial\n"sv);
}

TEST(ChildProcess, StdinIsNotATerminal)
{
	const auto result = RunShell("if test -t 0; then echo tty; else echo notty; fi");
	EXPECT_EQ(result.output, "notty\n"sv);
}

TEST(ChildProcess, StdinIsEmpty)
{
	/* a program reading standard input sees end-of-file right
	   away instead of blocking */
	ChildProcessOptions options;
	options.args = {"/bin/sh", "-c", "cat; echo eof"};
	options.timeout = std::chrono::seconds{5};

	const auto result = RunChildProcess(options);
	EXPECT_TRUE(result.Succeeded());
	EXPECT_FALSE(result.timed_out);
	EXPECT_EQ(result.output, "eof\n"sv);
}

TEST(ChildProcess, NoControllingTerminal)
{
	const auto result = RunShell("if ( : </dev/tty ) 2>/dev/null; then echo tty; else echo notty; fi");
	EXPECT_EQ(result.output, "notty\n"sv);
}

TEST(ChildProcess, StderrDiscarded)
{
	const auto result = RunShell("echo error >&2; echo out");
	EXPECT_EQ(result.output, "out\n"sv);
}

TEST(ChildProcess, Environment)
{
	setenv("SSH_ASKPASS", "/usr/bin/ssh-askpass", 1);
	setenv("KEYSURVEY_TEST", "old", 1);

	ChildProcessOptions options;
	options.args = {"/bin/sh", "-c", "echo \"${SSH_ASKPASS-unset} $KEYSURVEY_TEST\""};
	options.unsetenv = {"SSH_ASKPASS"};
	options.setenv = {"KEYSURVEY_TEST=new"};

	const auto result = RunChildProcess(options);

	unsetenv("SSH_ASKPASS");
	unsetenv("KEYSURVEY_TEST");

	EXPECT_EQ(result.output, "unset new\n"sv);
}

TEST(ChildProcess, Timeout)
{
	const auto start = std::chrono::steady_clock::now();
	const auto result = RunShell("echo started; sleep 30",
				     std::chrono::milliseconds{300});
	const auto duration = std::chrono::steady_clock::now() - start;

	EXPECT_TRUE(result.timed_out);
	EXPECT_FALSE(result.Succeeded());
	EXPECT_LT(duration, std::chrono::seconds{10});

	/* output of a killed process is not used */
	EXPECT_TRUE(result.output.empty());
}

TEST(ChildProcess, MaxOutput)
{
	ChildProcessOptions options;
	options.args = {"/bin/sh", "-c", "i=0; while [ $i -lt 1000 ]; do echo 0123456789; i=$((i+1)); done"};
	options.max_output = 100;

	const auto result = RunChildProcess(options);
	EXPECT_TRUE(result.Succeeded());
	EXPECT_EQ(result.output.size(), 100U);
}

TEST(ChildProcess, ExecFailure)
{
	ChildProcessOptions options;
	options.args = {"/nonexistent/keysurvey-test"};

	const auto result = RunChildProcess(options);
	EXPECT_FALSE(result.Succeeded());
	EXPECT_EQ(result.exit_status, 127);
}

TEST(ChildProcess, NoProgram)
{
	EXPECT_THROW(RunChildProcess({}), std::invalid_argument);
}

/* cancellation cannot be undone, so these run in a child process */

TEST(ChildProcessDeathTest, Cancel)
{
	EXPECT_EXIT({
		std::thread canceller{[]{
			std::this_thread::sleep_for(std::chrono::milliseconds{200});
			RequestCancel();
		}};

		const auto start = std::chrono::steady_clock::now();
		const auto result = RunShell("echo started; sleep 30; echo finished",
					     std::chrono::seconds{60});
		const auto duration = std::chrono::steady_clock::now() - start;
		canceller.join();

		const bool ok = result.cancelled && !result.timed_out &&
			!result.Succeeded() && result.output.empty() &&
			duration < std::chrono::seconds{10};
		_exit(ok ? 0 : 1);
	}, ::testing::ExitedWithCode(0), "");
}

TEST(ChildProcessDeathTest, CancelledBeforeStart)
{
	EXPECT_EXIT({
		RequestCancel();
		const auto result = RunShell("echo hello");
		_exit(result.cancelled && result.output.empty() ? 0 : 1);
	}, ::testing::ExitedWithCode(0), "");
}
