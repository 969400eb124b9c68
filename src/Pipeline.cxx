// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Pipeline.hxx"
#include "Assemble.hxx"
#include "Reconcile.hxx"
#include "FileInfo.hxx"
#include "Log.hxx"
#include "key/Decoder.hxx"
#include "key/KeyType.hxx"
#include "system/Cancel.hxx"
#include "system/Error.hxx"

/**
 * The public key record for an encrypted file whose container
 * revealed the fingerprint (SSH1); other fields stay empty.
 */
static std::optional<PublicKeyRecord>
MakeFingerprintOnlyRecord(const DecodeResult &decoded) noexcept
{
	if (decoded.embedded_public_key.empty())
		return std::nullopt;

	auto record = MakePublicKeyRecord(decoded.embedded_public_key);
	if (record)
		record->line.clear();

	return record;
}

std::optional<KeyReport>
ProcessCandidateFile(KeyTool &tool, const CandidateFile &file)
{
	const auto decoded = DecodeKeyFile(file.contents);
	if (decoded.format == KeyFormat::UNRECOGNIZED)
		return std::nullopt;

	LogFmt(2, "{}: {} key, {}", file.path,
	       ToString(decoded.format), ToString(decoded.encryption));

	std::optional<PublicKeyRecord> key;

	if (decoded.encryption == EncryptionVerdict::UNENCRYPTED) {
		key = DerivePublicKeyRecord(tool, file.path, decoded);
		if (key)
			key = ReconcilePublicKey(std::move(*key),
						 LoadCompanionPublicKey(file.path));
	}

	if (!key) {
		/* fallback: trust the companion file without
		   cross-check */
		key = LoadCompanionPublicKey(file.path);
		if (key)
			key->verified = false;
	}

	if (!key && decoded.encryption == EncryptionVerdict::ENCRYPTED)
		key = MakeFingerprintOnlyRecord(decoded);

	if (!key) {
		LogFmt(2, "{}: no public key", file.path);
		return std::nullopt;
	}

	/* a cancelled tool invocation may have caused a fallback;
	   never emit such a record */
	if (IsCancelRequested())
		return std::nullopt;

	return AssembleKeyReport(file, decoded, std::move(*key));
}

std::optional<KeyReport>
ProcessCandidatePath(KeyTool &tool, const PipelineConfig &config,
		     std::string path)
try {
	if (IsCancelRequested())
		return std::nullopt;

	const auto file = LoadCandidateFile(path, config.read_limit);
	return ProcessCandidateFile(tool, file);
} catch (const ResourceError &) {
	throw;
} catch (...) {
	LogException(2, path, std::current_exception());
	return std::nullopt;
}
