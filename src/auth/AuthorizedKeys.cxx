// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "AuthorizedKeys.hxx"
#include "scan/Passwd.hxx"
#include "key/Fingerprint.hxx"
#include "FileInfo.hxx"
#include "Log.hxx"
#include "StringUtil.hxx"
#include "system/Cancel.hxx"

#include <set>

using std::string_view_literals::operator""sv;

static constexpr std::size_t MAX_SSHD_CONFIG_SIZE = 1024 * 1024;
static constexpr std::size_t MAX_AUTHORIZED_KEYS_SIZE = 4 * 1024 * 1024;

static std::vector<std::string>
DefaultAuthorizedKeysFiles()
{
	return {".ssh/authorized_keys", ".ssh/authorized_keys2"};
}

std::vector<std::string>
ParseAuthorizedKeysFiles(std::string_view sshd_config)
{
	LineSplitter lines{sshd_config};
	while (const auto i = lines.Next()) {
		const auto line = Strip(*i);
		if (line.empty() || line.front() == '#')
			continue;

		/* the keyword may be separated by whitespace or "=" */
		std::size_t n = 0;
		while (n < line.size() && !IsWhitespaceASCII(line[n]) && line[n] != '=')
			++n;

		const auto keyword = line.substr(0, n);
		auto value = StripLeft(line.substr(n));
		if (value.starts_with('='))
			value = StripLeft(value.substr(1));

		if (StringIsEqualIgnoreCase(keyword, "Match"sv))
			break;

		if (!StringIsEqualIgnoreCase(keyword, "AuthorizedKeysFile"sv))
			continue;

		std::vector<std::string> result;
		while (!value.empty()) {
			auto [word, rest] = SplitWord(value);
			if (word.size() >= 2 && word.front() == '"' && word.back() == '"')
				word = word.substr(1, word.size() - 2);

			if (word == "none"sv)
				return {};

			result.emplace_back(word);
			value = rest;
		}

		if (!result.empty())
			return result;
	}

	return DefaultAuthorizedKeysFiles();
}

std::vector<std::string>
LoadAuthorizedKeysFiles(const std::filesystem::path &root)
{
	const auto path = MakeRootedPath(root, "/etc/ssh/sshd_config");

	std::string contents;
	try {
		contents = ReadSmallTextFile(path.c_str(), MAX_SSHD_CONFIG_SIZE);
	} catch (...) {
		LogException(1, path.native(), std::current_exception());
	}

	return ParseAuthorizedKeysFiles(contents);
}

std::string
ExpandAuthorizedKeysPattern(std::string_view pattern, const PasswdEntry &user)
{
	std::string result;

	for (std::size_t i = 0; i < pattern.size(); ++i) {
		const char ch = pattern[i];
		if (ch != '%' || i + 1 == pattern.size()) {
			result.push_back(ch);
			continue;
		}

		switch (pattern[++i]) {
		case 'h':
			result.append(user.home);
			break;

		case 'u':
			result.append(user.name);
			break;

		case 'U':
			result.append(std::to_string(user.uid));
			break;

		case '%':
			result.push_back('%');
			break;

		default:
			/* unknown token: keep it */
			result.push_back('%');
			result.push_back(pattern[i]);
			break;
		}
	}

	if (!result.starts_with('/')) {
		std::string home = user.home;
		if (!home.ends_with('/'))
			home.push_back('/');
		result.insert(0, home);
	}

	return result;
}

std::vector<AuthorizedKeyReport>
LoadAuthorizedKeysFile(const std::string &path)
{
	std::vector<AuthorizedKeyReport> result;

	const auto contents = ReadSmallTextFile(path.c_str(),
						MAX_AUTHORIZED_KEYS_SIZE);
	if (contents.empty())
		return result;

	const auto metadata = LoadFileMetadata(path.c_str());

	LineSplitter lines{contents};
	while (const auto i = lines.Next()) {
		const auto line = Strip(*i);
		auto listing = FingerprintPublicKeyLine(line);
		if (!listing)
			continue;

		result.push_back({
			.path = path,
			.file = metadata,
			.type = std::move(listing->type),
			.bits = listing->bits,
			.fingerprint = std::move(listing->fingerprint),
			.line = std::string{line},
		});
	}

	return result;
}

void
InventoryAuthorizedKeys(const std::filesystem::path &root,
			const std::vector<PasswdEntry> &users,
			const AuthorizedKeyHandler &handler)
{
	const auto patterns = LoadAuthorizedKeysFiles(root);

	std::set<std::string> visited;

	for (const auto &user : users) {
		for (const auto &pattern : patterns) {
			if (IsCancelRequested())
				return;

			const auto path =
				MakeRootedPath(root, ExpandAuthorizedKeysPattern(pattern, user)).native();
			if (!visited.emplace(path).second)
				continue;

			std::vector<AuthorizedKeyReport> reports;
			try {
				reports = LoadAuthorizedKeysFile(path);
			} catch (...) {
				LogException(2, path, std::current_exception());
				continue;
			}

			for (auto &i : reports)
				handler(std::move(i));
		}
	}
}
