// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Decoder.hxx"
#include "Format.hxx"
#include "SSH1.hxx"
#include "PEM.hxx"
#include "OpenSSHV1.hxx"
#include "ByteCast.hxx"

DecodeResult
DecodeKeyFile(std::span<const std::byte> contents) noexcept
{
	DecodeResult result;
	result.format = ClassifyKeyFile(contents);

	switch (result.format) {
	case KeyFormat::SSH1:
		result.encryption = CheckSSH1Encryption(contents);
		if (result.encryption != EncryptionVerdict::UNKNOWN)
			result.embedded_public_key = ExtractSSH1PublicKey(contents);
		break;

	case KeyFormat::PEM_GENERIC:
		result.encryption = CheckPEMEncryption(AsStringView(contents));
		break;

	case KeyFormat::OPENSSH_V1:
		result.encryption = CheckOpenSSHV1Encryption(AsStringView(contents));
		break;

	case KeyFormat::UNRECOGNIZED:
		break;
	}

	return result;
}
