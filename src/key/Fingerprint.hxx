// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

struct PublicKeyLine;

/**
 * What the fingerprinting capability reports about a public key.
 */
struct KeyListing {
	/**
	 * Short type name, e.g. "RSA"; "NA" if unknown.
	 */
	std::string type;

	/**
	 * Key size in bits; 0 if unknown.
	 */
	unsigned bits = 0;

	/**
	 * MD5 fingerprint in colon-separated lower-case hex (47
	 * characters).
	 */
	std::string fingerprint;
};

/**
 * Length of a fingerprint string returned by
 * FormatMD5Fingerprint().
 */
static constexpr std::size_t FINGERPRINT_LENGTH = 47;

std::string
FormatMD5Fingerprint(std::span<const std::byte> digest);

/**
 * Calculate type, size and fingerprint of a SSH2 public key blob.
 * Throws on malformed blobs.
 */
KeyListing
FingerprintPublicKeyBlob(std::span<const std::byte> blob);

/**
 * Calculate type, size and fingerprint of a parsed public key line
 * (SSH1 or SSH2).  Throws on malformed keys.
 */
KeyListing
FingerprintPublicKey(const PublicKeyLine &line);

/**
 * Parse and fingerprint one public key line.
 *
 * @return the listing or std::nullopt if the line does not contain
 * a valid public key
 */
std::optional<KeyListing>
FingerprintPublicKeyLine(std::string_view line) noexcept;
