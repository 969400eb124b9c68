// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SSH1.hxx"
#include "Headers.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/BN.hxx"
#include "Log.hxx"

#include <fmt/core.h>

static bool
SkipSSH1Header(SSH::Deserializer &d) noexcept
{
	return d.SkipPrefix(ssh1_id_string) &&
		d.SkipPrefix(ssh1_id_terminator);
}

EncryptionVerdict
CheckSSH1Encryption(std::span<const std::byte> contents) noexcept
{
	static_assert(SSH1_CIPHER_OFFSET == ssh1_id_string.size() + ssh1_id_terminator.size());

	SSH::Deserializer d{contents};
	if (!SkipSSH1Header(d) || contents.size() <= SSH1_CIPHER_OFFSET)
		return EncryptionVerdict::UNKNOWN;

	return contents[SSH1_CIPHER_OFFSET] == SSH1_CIPHER_NONE
		? EncryptionVerdict::UNENCRYPTED
		: EncryptionVerdict::ENCRYPTED;
}

/* the comment is the last field of a public key line; line breaks
   in it would split the record */
static std::string_view
SanitizeComment(std::string_view comment) noexcept
{
	const auto eol = comment.find_first_of("\r\n");
	if (eol != comment.npos)
		comment = comment.substr(0, eol);
	return comment;
}

std::string
ExtractSSH1PublicKey(std::span<const std::byte> contents) noexcept
try {
	SSH::Deserializer d{contents};
	if (!SkipSSH1Header(d))
		return {};

	d.ReadU8(); // cipher type
	d.ReadU32(); // reserved

	const auto bits = d.ReadU32();
	/* SSH1 integers are unsigned, unlike SSH2 "mpint" */
	const auto n = BN_bin2bn(d.ReadSSH1MPInt());
	const auto e = BN_bin2bn(d.ReadSSH1MPInt());
	const auto comment = SanitizeComment(d.ReadString());

	std::string line = fmt::format("{} {} {}", bits,
				       BN_bn2dec(*e), BN_bn2dec(*n));
	if (!comment.empty()) {
		line.push_back(' ');
		line.append(comment);
	}

	return line;
} catch (SSH::MalformedPacket) {
	/* truncated */
	return {};
} catch (...) {
	LogException(2, "Failed to read SSH1 public key",
		     std::current_exception());
	return {};
}
