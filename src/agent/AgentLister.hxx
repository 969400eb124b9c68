// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Report.hxx"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

class KeyTool;

/**
 * One line of "ssh-add -l" output, e.g. "256 MD5:e8:af:...
 * user@host (ED25519)".
 */
struct AgentIdentityLine {
	unsigned bits = 0;

	/**
	 * The fingerprint without the "MD5:" prefix.
	 */
	std::string fingerprint;

	std::string comment;

	/**
	 * The key type without the parentheses; "NA" if the line has
	 * none (older OpenSSH versions).
	 */
	std::string type{KEY_TYPE_UNKNOWN};
};

std::optional<AgentIdentityLine>
ParseAgentIdentityLine(std::string_view line);

/**
 * Query the agent listening on the given socket.  Returns an empty
 * list if the path is not a socket, if the agent cannot be queried
 * or if it holds no identities.
 */
std::vector<AgentIdentity>
ListAgentIdentities(KeyTool &tool, const std::string &socket_path);
