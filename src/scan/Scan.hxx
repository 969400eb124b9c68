// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct PasswdEntry;

/**
 * Receives the path of a candidate file.
 */
using CandidateHandler = std::function<void(std::string &&path)>;

/**
 * Report every regular file (except "*.pub", "authorized_keys*",
 * "known_hosts*" and "config") directly inside the
 * ".ssh" directory of each user's home directory.  Homes shared by
 * several users are scanned only once.  Stops early if
 * cancellation is requested.
 */
void
ScanHomeDirectories(const std::filesystem::path &root,
		    const std::vector<PasswdEntry> &users,
		    const CandidateHandler &handler);

struct FullScanConfig {
	std::filesystem::path root{"/"};

	std::uintmax_t min_size = 200, max_size = 14000;

	/**
	 * Absolute paths (relative to the scanned system) of
	 * directories which are not descended into.
	 */
	std::vector<std::string> exclude;
};

/**
 * Report every regular file below the root whose size is within
 * the configured range.  Symlinks are not followed; unreadable
 * directories are skipped.  Throws #ScanRootError if the root
 * itself is not a readable directory.
 */
void
ScanFileSystem(const FullScanConfig &config, const CandidateHandler &handler);
