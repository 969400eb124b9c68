// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Passwd.hxx"
#include "Error.hxx"
#include "FileInfo.hxx"
#include "StringUtil.hxx"

#include <fmt/core.h>

#include <array>
#include <charconv>

static constexpr std::size_t MAX_PASSWD_SIZE = 16 * 1024 * 1024;

static bool
ParseUnsigned(std::string_view s, unsigned &value) noexcept
{
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	return ec == std::errc{} && ptr == s.data() + s.size();
}

std::vector<PasswdEntry>
ParsePasswd(std::string_view contents)
{
	std::vector<PasswdEntry> result;

	LineSplitter lines{contents};
	while (const auto line = lines.Next()) {
		if (line->empty() || line->front() == '#')
			continue;

		/* name:password:uid:gid:gecos:home:shell */
		std::array<std::string_view, 7> fields;
		std::string_view rest = *line;
		std::size_t n = 0;
		while (true) {
			const auto colon = rest.find(':');
			fields[n++] = rest.substr(0, colon);
			if (colon == rest.npos || n == fields.size())
				break;

			rest = rest.substr(colon + 1);
		}

		PasswdEntry entry;
		if (n < 6 || fields[0].empty() || fields[5].empty() ||
		    !ParseUnsigned(fields[2], entry.uid) ||
		    !ParseUnsigned(fields[3], entry.gid))
			continue;

		entry.name = fields[0];
		entry.home = fields[5];
		result.emplace_back(std::move(entry));
	}

	return result;
}

std::vector<PasswdEntry>
LoadPasswd(const std::filesystem::path &root)
try {
	const auto path = MakeRootedPath(root, "/etc/passwd");
	const auto contents = ReadSmallTextFile(path.c_str(), MAX_PASSWD_SIZE);
	if (contents.empty())
		throw ScanRootError{fmt::format("No users in {}", path.native())};

	return ParsePasswd(contents);
} catch (const ScanRootError &) {
	throw;
} catch (...) {
	std::throw_with_nested(ScanRootError{"Failed to load the user database"});
}

std::filesystem::path
MakeRootedPath(const std::filesystem::path &root, std::string_view path)
{
	while (path.starts_with('/'))
		path.remove_prefix(1);

	return root / path;
}
