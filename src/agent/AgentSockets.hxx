// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

/**
 * Extract the value of $SSH_AUTH_SOCK from the contents of a
 * /proc/PID/environ file (null-separated "NAME=VALUE" strings).
 *
 * @return the value or an empty string
 */
[[gnu::pure]]
std::string_view
FindAuthSockInEnviron(std::string_view environment) noexcept;

/**
 * Collect candidate SSH agent socket paths: $SSH_AUTH_SOCK of all
 * running processes plus the conventional locations of OpenSSH,
 * GNOME Keyring and GnuPG agent sockets.  The returned paths are
 * below the scan root; nothing is checked yet.
 */
std::set<std::string>
DiscoverAgentSockets(const std::filesystem::path &root);
