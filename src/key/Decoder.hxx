// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Verdict.hxx"

#include <cstddef>
#include <span>
#include <string>

/**
 * What can be learned about a private key file by looking at its
 * contents, without external tools.
 */
struct DecodeResult {
	KeyFormat format = KeyFormat::UNRECOGNIZED;

	EncryptionVerdict encryption = EncryptionVerdict::UNKNOWN;

	/**
	 * A public key line recovered directly from the container
	 * (only the SSH1 format stores it in clear text); empty if
	 * not available.
	 */
	std::string embedded_public_key;
};

/**
 * Classify the file and run the matching format decoder.  Never
 * throws and never blocks.
 */
DecodeResult
DecodeKeyFile(std::span<const std::byte> contents) noexcept;
