// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class ScanMode {
	/**
	 * Scan the ".ssh" directory of each user.
	 */
	HOME,

	/**
	 * Traverse the whole file system below the root.
	 */
	FULL,
};

struct Config {
	ScanMode mode = ScanMode::HOME;

	std::string root = "/";

	std::uintmax_t min_size = 200, max_size = 14000;

	std::vector<std::string> exclude;

	std::size_t read_limit = 32768;

	/**
	 * Number of worker threads; 0 means one per CPU.
	 */
	unsigned jobs = 0;

	std::chrono::seconds tool_timeout{10};

	std::string ssh_keygen = "/usr/bin/ssh-keygen";
	std::string ssh_add = "/usr/bin/ssh-add";

	bool private_keys = true, authorized_keys = true, agents = true;

	unsigned verbose = 1;

	/**
	 * Fill in defaults and check for inconsistencies.  Throws on
	 * error.
	 */
	void Check();
};

/**
 * Parse a scan mode name ("home" or "full").  Throws on error.
 */
ScanMode
ParseScanMode(std::string_view s);

/**
 * Parse one line of the configuration file.  Throws
 * ConfigLineParser::Error on error.
 */
void
ParseConfigLine(Config &config, std::string_view line);

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 *
 * @param must_exist if false, a missing file is not an error
 */
void
LoadConfigFile(Config &config, const char *path, bool must_exist=true);
