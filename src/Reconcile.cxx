// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Reconcile.hxx"
#include "FileInfo.hxx"
#include "Log.hxx"
#include "key/Decoder.hxx"
#include "key/Fingerprint.hxx"
#include "key/PublicKeyLine.hxx"
#include "tool/KeyTool.hxx"

/**
 * Companion files larger than this are not public key files.
 */
static constexpr std::size_t MAX_COMPANION_SIZE = 64 * 1024;

std::optional<PublicKeyRecord>
MakePublicKeyRecord(std::string_view line) noexcept
try {
	auto listing = FingerprintPublicKeyLine(line);
	if (!listing || listing->fingerprint.size() != FINGERPRINT_LENGTH)
		return std::nullopt;

	return PublicKeyRecord{
		.type = std::move(listing->type),
		.bits = listing->bits,
		.fingerprint = std::move(listing->fingerprint),
		.line = std::string{line},
	};
} catch (const std::bad_alloc &) {
	return std::nullopt;
}

std::optional<PublicKeyRecord>
DerivePublicKeyRecord(KeyTool &tool, const std::string &path,
		      const DecodeResult &decoded)
{
	if (!decoded.embedded_public_key.empty())
		return MakePublicKeyRecord(decoded.embedded_public_key);

	const auto line = tool.DerivePublicKey(path);
	if (!line)
		return std::nullopt;

	auto record = MakePublicKeyRecord(*line);
	if (!record)
		LogFmt(2, "{}: derived public key is not usable", path);

	return record;
}

std::optional<PublicKeyRecord>
LoadCompanionPublicKey(const std::string &private_key_path) noexcept
try {
	const auto path = private_key_path + ".pub";
	const auto contents = ReadSmallTextFile(path.c_str(), MAX_COMPANION_SIZE);
	if (contents.empty())
		return std::nullopt;

	const auto line = FindFirstPublicKeyLine(contents);
	if (line.empty())
		return std::nullopt;

	return MakePublicKeyRecord(line);
} catch (...) {
	LogException(2, private_key_path + ".pub", std::current_exception());
	return std::nullopt;
}

PublicKeyRecord
ReconcilePublicKey(PublicKeyRecord derived,
		   std::optional<PublicKeyRecord> companion) noexcept
{
	if (companion && companion->fingerprint == derived.fingerprint)
		return std::move(*companion);

	return derived;
}
