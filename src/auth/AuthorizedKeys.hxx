// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Report.hxx"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

struct PasswdEntry;

/**
 * Extract the "AuthorizedKeysFile" patterns from the contents of a
 * sshd_config(5) file.  Only the global section (before the first
 * "Match") is considered.  Returns the OpenSSH default if the
 * keyword is absent, and an empty list for "none".
 */
std::vector<std::string>
ParseAuthorizedKeysFiles(std::string_view sshd_config);

/**
 * Load ROOT/etc/ssh/sshd_config and call
 * ParseAuthorizedKeysFiles().  A missing or unreadable file yields
 * the OpenSSH default.
 */
std::vector<std::string>
LoadAuthorizedKeysFiles(const std::filesystem::path &root);

/**
 * Expand the tokens "%h" (home directory), "%u" (user name), "%U"
 * (numeric uid) and "%%" in an AuthorizedKeysFile pattern.  A
 * relative result is taken relative to the home directory.
 */
std::string
ExpandAuthorizedKeysPattern(std::string_view pattern, const PasswdEntry &user);

/**
 * Fingerprint every public key line in the given "authorized_keys"
 * file.  Returns an empty list if the file does not exist; throws
 * on other errors.
 */
std::vector<AuthorizedKeyReport>
LoadAuthorizedKeysFile(const std::string &path);

using AuthorizedKeyHandler = std::function<void(AuthorizedKeyReport &&report)>;

/**
 * Report the authorized keys of all users.  Errors concerning a
 * single file are logged.
 */
void
InventoryAuthorizedKeys(const std::filesystem::path &root,
			const std::vector<PasswdEntry> &users,
			const AuthorizedKeyHandler &handler);
