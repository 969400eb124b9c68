// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

struct ChildProcessOptions {
	/**
	 * The program (absolute path, no $PATH lookup) followed by
	 * its arguments.
	 */
	std::vector<std::string> args;

	/**
	 * "NAME=VALUE" strings which are added to the inherited
	 * environment (replacing existing variables of the same
	 * name).
	 */
	std::vector<std::string> setenv;

	/**
	 * Names of inherited environment variables to be removed.
	 */
	std::vector<std::string> unsetenv;

	std::chrono::milliseconds timeout{10000};

	/**
	 * Standard output beyond this size is discarded.
	 */
	std::size_t max_output = 65536;
};

struct ChildProcessResult {
	/**
	 * The exit status, or -1 if the process was killed by a
	 * signal.
	 */
	int exit_status = -1;

	/**
	 * Was the process killed because it exceeded the timeout?
	 */
	bool timed_out = false;

	/**
	 * Was the process killed because cancellation was
	 * requested?
	 */
	bool cancelled = false;

	std::string output;

	bool Succeeded() const noexcept {
		return exit_status == 0;
	}
};

/**
 * Run a program and capture its standard output.  Standard input
 * is /dev/null and the child runs in a new session without a
 * controlling terminal, so it can never prompt for a passphrase.
 * Standard error is discarded.  The child (and its process group)
 * is killed with SIGKILL when the timeout expires or cancellation
 * is requested.
 *
 * Throws ResourceError if the pipe or the process cannot be
 * created.
 */
ChildProcessResult
RunChildProcess(const ChildProcessOptions &options);
