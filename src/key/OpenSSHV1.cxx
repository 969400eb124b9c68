// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "OpenSSHV1.hxx"
#include "Headers.hxx"
#include "Base64.hxx"
#include "StringUtil.hxx"
#include "ssh/Deserializer.hxx"

using std::string_view_literals::operator""sv;

/**
 * Find the base64 text between the BEGIN and END lines.
 *
 * @return the body or std::nullopt if one of the lines is missing
 */
[[gnu::pure]]
static std::optional<std::string_view>
FindBody(std::string_view contents) noexcept
{
	const auto begin = contents.find(begin_openssh_private_key);
	if (begin == contents.npos)
		return std::nullopt;

	contents = contents.substr(begin + begin_openssh_private_key.size());

	const auto end = contents.find(end_openssh_private_key);
	if (end == contents.npos)
		return std::nullopt;

	return Strip(contents.substr(0, end));
}

[[gnu::pure]]
static EncryptionVerdict
CheckOpenSSHV1Cipher(std::span<const std::byte> src) noexcept
try {
	SSH::Deserializer d{src};
	if (!d.SkipPrefix(openssh_key_v1_magic))
		return EncryptionVerdict::UNKNOWN;

	const auto ciphername = d.ReadString();

	/* the following kdfname field must be present, too */
	d.ReadString();

	return ciphername == "none"sv
		? EncryptionVerdict::UNENCRYPTED
		: EncryptionVerdict::ENCRYPTED;
} catch (SSH::MalformedPacket) {
	return EncryptionVerdict::UNKNOWN;
}

EncryptionVerdict
CheckOpenSSHV1Encryption(std::string_view contents) noexcept
try {
	const auto body = FindBody(contents);
	if (!body)
		return EncryptionVerdict::UNKNOWN;

	const auto bin = DecodeBase64IgnoreWhitespace(*body);
	if (!bin)
		return EncryptionVerdict::UNKNOWN;

	return CheckOpenSSHV1Cipher(*bin);
} catch (const std::bad_alloc &) {
	return EncryptionVerdict::UNKNOWN;
}
