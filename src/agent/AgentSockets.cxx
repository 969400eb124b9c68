// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "AgentSockets.hxx"
#include "scan/Passwd.hxx"
#include "FileInfo.hxx"
#include "Log.hxx"

#include <system_error>

using std::string_view_literals::operator""sv;

static constexpr std::size_t MAX_ENVIRON_SIZE = 256 * 1024;

std::string_view
FindAuthSockInEnviron(std::string_view environment) noexcept
{
	static constexpr auto prefix = "SSH_AUTH_SOCK="sv;

	while (!environment.empty()) {
		const auto end = environment.find('\0');
		const auto entry = environment.substr(0, end);

		if (entry.starts_with(prefix))
			return entry.substr(prefix.size());

		if (end == environment.npos)
			break;

		environment = environment.substr(end + 1);
	}

	return {};
}

[[gnu::pure]]
static bool
IsPid(std::string_view name) noexcept
{
	if (name.empty())
		return false;

	for (const char ch : name)
		if (ch < '0' || ch > '9')
			return false;

	return true;
}

static void
CollectFromProcesses(const std::filesystem::path &root,
		     std::set<std::string> &result)
{
	std::error_code ec;
	std::filesystem::directory_iterator i{MakeRootedPath(root, "/proc"), ec};
	if (ec) {
		LogFmt(2, "Cannot list processes: {}", ec.message());
		return;
	}

	for (; i != std::filesystem::directory_iterator{}; i.increment(ec)) {
		if (!IsPid(i->path().filename().native()))
			continue;

		std::string environment;
		try {
			environment = ReadFileLimited((i->path() / "environ").c_str(),
						  MAX_ENVIRON_SIZE);
		} catch (const std::system_error &) {
			/* process has exited or belongs to another
			   user */
			continue;
		}

		const auto value = FindAuthSockInEnviron(environment);
		if (!value.empty())
			result.emplace(MakeRootedPath(root, value).native());
	}
}

/**
 * Add all entries of #directory whose name starts with #prefix.
 */
template<typename F>
static void
ForEachPrefixed(const std::filesystem::path &directory, std::string_view prefix,
		F &&f)
{
	std::error_code ec;
	std::filesystem::directory_iterator i{directory, ec};
	if (ec)
		return;

	for (; i != std::filesystem::directory_iterator{}; i.increment(ec)) {
		if (prefix.empty() ||
		    i->path().filename().native().starts_with(prefix))
			f(i->path());
	}
}

std::set<std::string>
DiscoverAgentSockets(const std::filesystem::path &root)
{
	std::set<std::string> result;

	CollectFromProcesses(root, result);

	/* OpenSSH: /tmp/ssh-XXXXXXXXXX/agent.PID */
	ForEachPrefixed(MakeRootedPath(root, "/tmp"), "ssh-"sv, [&result](const auto &dir){
		ForEachPrefixed(dir, "agent."sv, [&result](const auto &socket){
			result.emplace(socket.native());
		});
	});

	/* GNOME Keyring and GnuPG in /run/user/UID */
	ForEachPrefixed(MakeRootedPath(root, "/run/user"), {}, [&result](const auto &dir){
		for (const auto *name : {"keyring/ssh", "gnupg/S.gpg-agent.ssh"}) {
			auto socket = dir / name;
			std::error_code ec;
			if (std::filesystem::exists(socket, ec))
				result.emplace(socket.native());
		}
	});

	return result;
}
