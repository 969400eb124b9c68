// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * External capabilities which need the real OpenSSH tools.
 * Implementations must never block on interactive input.
 */
class KeyTool {
public:
	KeyTool() noexcept = default;
	virtual ~KeyTool() noexcept = default;

	KeyTool(const KeyTool &) = delete;
	KeyTool &operator=(const KeyTool &) = delete;

	/**
	 * Derive the public key line from an unencrypted private key
	 * file.
	 *
	 * @return the public key line or std::nullopt if derivation
	 * failed for any reason
	 */
	virtual std::optional<std::string> DerivePublicKey(const std::string &path) = 0;

	/**
	 * List the identities of the SSH agent listening on the
	 * given socket, one line per identity in the format of
	 * "ssh-add -l -E md5".
	 *
	 * @return the (possibly empty) list of lines or std::nullopt
	 * if the agent could not be queried
	 */
	virtual std::optional<std::vector<std::string>> ListAgentIdentities(const std::string &socket_path) = 0;
};
