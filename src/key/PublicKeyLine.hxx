// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string_view>

/**
 * The parts of one line of a public key file or an
 * "authorized_keys" file.  All members point into the line.
 */
struct PublicKeyLine {
	/**
	 * The authorized_keys options preceding the key (without the
	 * separating space), or empty.
	 */
	std::string_view options;

	/**
	 * SSH2: the algorithm identifier, e.g. "ssh-ed25519".
	 */
	std::string_view algorithm;

	/**
	 * SSH2: the base64-encoded public key blob.
	 */
	std::string_view blob;

	/**
	 * SSH1: the decimal fields "bits exponent modulus".
	 */
	std::string_view bits, exponent, modulus;

	std::string_view comment;

	bool IsSSH1() const noexcept {
		return !modulus.empty();
	}
};

/**
 * Split a public key line into its parts.  Returns std::nullopt
 * for blank lines, comment lines and lines which cannot be parsed.
 * The key material itself is not validated.
 */
[[gnu::pure]]
std::optional<PublicKeyLine>
ParsePublicKeyLine(std::string_view line) noexcept;

/**
 * Find the first line in the given text which parses as a public
 * key and return it (without line terminator and surrounding
 * whitespace).  Returns an empty string if there is none.
 */
[[gnu::pure]]
std::string_view
FindFirstPublicKeyLine(std::string_view text) noexcept;
