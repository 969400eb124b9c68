// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct PasswdEntry {
	std::string name;

	unsigned uid = 0, gid = 0;

	std::string home;
};

/**
 * Parse the contents of a passwd(5) file.  Malformed lines and
 * entries without a home directory are skipped.
 */
std::vector<PasswdEntry>
ParsePasswd(std::string_view contents);

/**
 * Load ROOT/etc/passwd.  Throws #ScanRootError if it cannot be
 * read.
 */
std::vector<PasswdEntry>
LoadPasswd(const std::filesystem::path &root);

/**
 * Map an absolute path on the scanned system to a path below the
 * scan root.
 */
std::filesystem::path
MakeRootedPath(const std::filesystem::path &root, std::string_view path);
