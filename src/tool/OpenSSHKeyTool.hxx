// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "KeyTool.hxx"

#include <chrono>

struct OpenSSHKeyToolConfig {
	std::string ssh_keygen = "/usr/bin/ssh-keygen";

	std::string ssh_add = "/usr/bin/ssh-add";

	std::chrono::milliseconds timeout{std::chrono::seconds{10}};
};

/**
 * Implementation of #KeyTool which runs "ssh-keygen" and
 * "ssh-add" with an empty passphrase and without terminal or
 * askpass helper.
 */
class OpenSSHKeyTool final : public KeyTool {
	const OpenSSHKeyToolConfig config;

public:
	explicit OpenSSHKeyTool(const OpenSSHKeyToolConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class KeyTool */
	std::optional<std::string> DerivePublicKey(const std::string &path) override;
	std::optional<std::vector<std::string>> ListAgentIdentities(const std::string &socket_path) override;
};
