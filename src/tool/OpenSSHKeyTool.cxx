// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "OpenSSHKeyTool.hxx"
#include "system/ChildProcess.hxx"
#include "StringUtil.hxx"
#include "Log.hxx"

using std::string_view_literals::operator""sv;

/**
 * ssh-add exits with this status if the agent has no identities.
 */
static constexpr int SSH_ADD_NO_IDENTITIES = 1;

static ChildProcessOptions
MakeOptions(std::chrono::milliseconds timeout,
	    std::initializer_list<std::string> args)
{
	ChildProcessOptions options;
	options.args = args;
	options.timeout = timeout;

	/* make sure no graphical passphrase dialog pops up */
	options.unsetenv = {"SSH_ASKPASS", "DISPLAY", "WAYLAND_DISPLAY"};
	options.setenv = {"SSH_ASKPASS_REQUIRE=never"};
	return options;
}

std::optional<std::string>
OpenSSHKeyTool::DerivePublicKey(const std::string &path)
{
	/* -P "": try the empty passphrase instead of asking */
	const auto result = RunChildProcess(MakeOptions(config.timeout, {
		config.ssh_keygen, "-y", "-P", "", "-f", path,
	}));

	if (!result.Succeeded()) {
		LogFmt(2, "{}: ssh-keygen failed (status {}{})", path,
		       result.exit_status,
		       result.timed_out ? ", timeout" : "");
		return std::nullopt;
	}

	const auto line = Strip(result.output);
	if (line.empty() || line.find('\n') != line.npos)
		return std::nullopt;

	return std::string{line};
}

std::optional<std::vector<std::string>>
OpenSSHKeyTool::ListAgentIdentities(const std::string &socket_path)
{
	auto options = MakeOptions(config.timeout, {
		config.ssh_add, "-l", "-E", "md5",
	});
	options.setenv.emplace_back("SSH_AUTH_SOCK=" + socket_path);

	const auto result = RunChildProcess(options);

	std::vector<std::string> lines;

	if (result.exit_status == SSH_ADD_NO_IDENTITIES &&
	    result.output.find("no identities"sv) != result.output.npos)
		return lines;

	if (!result.Succeeded()) {
		LogFmt(2, "{}: ssh-add failed (status {}{})", socket_path,
		       result.exit_status,
		       result.timed_out ? ", timeout" : "");
		return std::nullopt;
	}

	LineSplitter splitter{result.output};
	while (const auto line = splitter.Next())
		if (const auto stripped = Strip(*line); !stripped.empty())
			lines.emplace_back(stripped);

	return lines;
}
