// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Scan.hxx"
#include "Passwd.hxx"
#include "Log.hxx"
#include "system/Cancel.hxx"

#include <set>

using std::string_view_literals::operator""sv;

/**
 * Is this a well-known file in "~/.ssh" which never contains a
 * private key?
 */
[[gnu::pure]]
static bool
IsKnownNonKeyFile(std::string_view name) noexcept
{
	return name.ends_with(".pub"sv) ||
		name.starts_with("authorized_keys"sv) ||
		name.starts_with("known_hosts"sv) ||
		name == "config"sv;
}

static void
ScanSSHDirectory(const std::filesystem::path &directory,
		 const CandidateHandler &handler)
{
	std::error_code ec;
	std::filesystem::directory_iterator i{directory, ec};
	if (ec) {
		if (ec != std::errc::no_such_file_or_directory &&
		    ec != std::errc::not_a_directory)
			LogFmt(2, "{}: {}", directory.native(), ec.message());
		return;
	}

	for (; i != std::filesystem::directory_iterator{}; i.increment(ec)) {
		if (IsCancelRequested())
			break;

		const auto &path = i->path();
		if (IsKnownNonKeyFile(path.filename().native()))
			continue;

		/* follows symlinks */
		std::error_code type_ec;
		if (!i->is_regular_file(type_ec))
			continue;

		handler(std::string{path.native()});
	}

	if (ec)
		LogFmt(2, "{}: {}", directory.native(), ec.message());
}

void
ScanHomeDirectories(const std::filesystem::path &root,
		    const std::vector<PasswdEntry> &users,
		    const CandidateHandler &handler)
{
	std::set<std::string> visited;

	for (const auto &user : users) {
		if (IsCancelRequested())
			break;

		if (!visited.emplace(user.home).second)
			continue;

		ScanSSHDirectory(MakeRootedPath(root, user.home) / ".ssh",
				 handler);
	}
}
