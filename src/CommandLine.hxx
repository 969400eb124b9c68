// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Config.hxx"

#include <optional>
#include <string>

#include <stdio.h>

/**
 * Settings from the command line.  Unset fields do not override
 * the configuration file.
 */
struct CommandLine {
	const char *config_path = "/etc/keysurvey/keysurvey.conf";

	/**
	 * Was "-c" given?  Only then is a missing configuration file
	 * an error.
	 */
	bool explicit_config_path = false;

	bool help = false;

	std::optional<ScanMode> mode;

	std::optional<std::string> root;

	std::optional<std::uintmax_t> min_size, max_size;

	std::optional<unsigned> jobs;

	std::optional<std::chrono::seconds> tool_timeout;

	/**
	 * Number of "-v" options.
	 */
	unsigned verbose = 0;

	bool quiet = false;

	bool no_private_keys = false, no_authorized_keys = false,
		no_agents = false;

	/**
	 * Copy all settings given on the command line to the
	 * #Config.
	 */
	void ApplyTo(Config &config) const noexcept;
};

/**
 * Throws std::runtime_error on usage error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);

void
PrintUsage(FILE *file, const char *program);
