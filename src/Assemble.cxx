// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Assemble.hxx"
#include "key/Decoder.hxx"
#include "key/PublicKeyLine.hxx"

[[gnu::pure]]
static std::string_view
GuessKeyType(std::string_view line, KeyFormat format) noexcept
{
	if (const auto parsed = ParsePublicKeyLine(line)) {
		if (parsed->IsSSH1())
			return KEY_TYPE_RSA1;

		if (const auto type = GetKeyTypeName(parsed->algorithm);
		    type != KEY_TYPE_UNKNOWN)
			return type;
	}

	if (format == KeyFormat::SSH1)
		return KEY_TYPE_RSA1;

	return KEY_TYPE_UNKNOWN;
}

KeyReport
AssembleKeyReport(const CandidateFile &file, const DecodeResult &decoded,
		  PublicKeyRecord key)
{
	if (key.type.empty() || key.type == KEY_TYPE_UNKNOWN)
		key.type = GuessKeyType(key.line, decoded.format);

	return {
		.path = file.path,
		.file = file.metadata,
		.format = decoded.format,
		.encryption = decoded.encryption,
		.key = std::move(key),
	};
}
