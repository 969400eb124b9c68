// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Format.hxx"
#include "Headers.hxx"
#include "ByteCast.hxx"
#include "StringUtil.hxx"

#include <array>

/**
 * Header lines are never longer than this; the classifier looks no
 * further.
 */
static constexpr std::size_t MAX_HEADER_WINDOW = 1024;

[[gnu::pure]]
static bool
IsPEMPrivateKeyHeader(std::string_view line) noexcept
{
	for (const auto i : pem_private_key_headers)
		if (line == i)
			return true;

	/* PKCS#8 and other "-----BEGIN ... PRIVATE KEY-----"
	   variants */
	return line.starts_with(pem_begin_prefix) &&
		line.ends_with(pem_private_key_suffix);
}

KeyFormat
ClassifyKeyFile(std::span<const std::byte> contents) noexcept
{
	std::string_view rest = AsStringView(contents);
	if (rest.size() > MAX_HEADER_WINDOW)
		rest = rest.substr(0, MAX_HEADER_WINDOW);

	std::array<std::string_view, 2> lines;
	std::size_t n_lines = 0;

	LineSplitter splitter{rest};
	while (n_lines < lines.size()) {
		const auto line = splitter.Next();
		if (!line)
			break;

		if (const auto stripped = Strip(*line); !stripped.empty())
			lines[n_lines++] = stripped;
	}

	const std::span<const std::string_view> found{lines.data(), n_lines};

	/* the OpenSSH header takes priority */
	for (const auto line : found)
		if (line == begin_openssh_private_key)
			return KeyFormat::OPENSSH_V1;

	for (const auto line : found) {
		if (line == ssh1_id_string)
			return KeyFormat::SSH1;

		if (IsPEMPrivateKeyHeader(line))
			return KeyFormat::PEM_GENERIC;
	}

	return KeyFormat::UNRECOGNIZED;
}
