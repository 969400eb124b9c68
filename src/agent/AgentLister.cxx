// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "AgentLister.hxx"
#include "FileInfo.hxx"
#include "Log.hxx"
#include "StringUtil.hxx"
#include "tool/KeyTool.hxx"

#include <charconv>
#include <tuple> // for std::tie()

#include <sys/stat.h>

using std::string_view_literals::operator""sv;

std::optional<AgentIdentityLine>
ParseAgentIdentityLine(std::string_view line)
{
	auto [bits, rest] = SplitWord(line);
	std::string_view fingerprint;
	std::tie(fingerprint, rest) = SplitWord(rest);

	AgentIdentityLine result;

	const auto [ptr, ec] = std::from_chars(bits.data(), bits.data() + bits.size(),
					       result.bits);
	if (ec != std::errc{} || ptr != bits.data() + bits.size() ||
	    fingerprint.empty())
		return std::nullopt;

	if (fingerprint.starts_with("MD5:"sv))
		fingerprint.remove_prefix(4);

	result.fingerprint = fingerprint;

	rest = StripRight(rest);
	if (rest.ends_with(')')) {
		if (const auto open = rest.rfind('('); open != rest.npos) {
			result.type = rest.substr(open + 1, rest.size() - open - 2);
			rest = StripRight(rest.substr(0, open));
		}
	}

	result.comment = rest;
	return result;
}

/**
 * Does the comment look like the path of the key file the identity
 * was loaded from?
 */
[[gnu::pure]]
static bool
IsPathComment(std::string_view comment) noexcept
{
	return comment.find('/') != comment.npos &&
		comment.find(' ') == comment.npos;
}

std::vector<AgentIdentity>
ListAgentIdentities(KeyTool &tool, const std::string &socket_path)
{
	std::vector<AgentIdentity> result;

	struct stat st;
	if (stat(socket_path.c_str(), &st) < 0 || !S_ISSOCK(st.st_mode)) {
		LogFmt(2, "{}: not a socket", socket_path);
		return result;
	}

	const auto lines = tool.ListAgentIdentities(socket_path);
	if (!lines)
		return result;

	const auto metadata = MakeFileMetadata(st);

	for (const auto &line : *lines) {
		auto parsed = ParseAgentIdentityLine(line);
		if (!parsed) {
			LogFmt(2, "{}: unexpected ssh-add output: {}",
			       socket_path, line);
			continue;
		}

		AgentIdentity identity{
			.socket_path = socket_path,
			.socket = metadata,
			.type = std::move(parsed->type),
			.bits = parsed->bits,
			.fingerprint = std::move(parsed->fingerprint),
		};

		if (IsPathComment(parsed->comment))
			identity.remote_path = std::move(parsed->comment);

		result.emplace_back(std::move(identity));
	}

	return result;
}
