// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "PEM.hxx"
#include "Headers.hxx"
#include "StringUtil.hxx"

using std::string_view_literals::operator""sv;

/**
 * Parse the value of a "Proc-Type" header, e.g. "4,ENCRYPTED".
 * The second field is compared case-sensitively.
 */
[[gnu::pure]]
static bool
IsEncryptedProcType(std::string_view value) noexcept
{
	const auto [version, rest] = Split(value, ',');
	const auto [type, _] = Split(rest, ',');
	return Strip(type) == "ENCRYPTED"sv;
}

EncryptionVerdict
CheckPEMEncryption(std::string_view contents) noexcept
{
	bool in_block = false, encrypted = false;

	LineSplitter lines{contents};
	while (const auto i = lines.Next()) {
		const auto line = Strip(*i);

		if (!in_block) {
			if (line.starts_with(pem_begin_prefix) &&
			    line.ends_with(pem_private_key_suffix)) {
				in_block = true;
				encrypted = line == begin_pkcs8_encrypted;
			}

			continue;
		}

		if (line.starts_with(pem_end_prefix))
			return encrypted
				? EncryptionVerdict::ENCRYPTED
				: EncryptionVerdict::UNENCRYPTED;

		static constexpr auto proc_type = "Proc-Type:"sv;
		if (StartsWithIgnoreCase(line, proc_type) &&
		    IsEncryptedProcType(line.substr(proc_type.size())))
			encrypted = true;
	}

	/* no END line: truncated */
	return encrypted
		? EncryptionVerdict::ENCRYPTED
		: EncryptionVerdict::UNKNOWN;
}
