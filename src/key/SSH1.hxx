// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Verdict.hxx"

#include <cstddef>
#include <span>
#include <string>

/**
 * Offset of the cipher type byte in a SSH1 private key file: the
 * identification string, a newline and a null byte precede it.
 */
static constexpr std::size_t SSH1_CIPHER_OFFSET = 33;

/**
 * Cipher type value meaning "no encryption".
 */
static constexpr std::byte SSH1_CIPHER_NONE{0};

/**
 * Check the cipher type byte of a SSH1 private key file.
 */
[[gnu::pure]]
EncryptionVerdict
CheckSSH1Encryption(std::span<const std::byte> contents) noexcept;

/**
 * Extract the clear-text public part of a SSH1 private key file
 * (which is available even if the private part is encrypted) and
 * format it as a SSH1 public key line ("bits exponent modulus
 * comment").
 *
 * @return the public key line or an empty string if the file is
 * malformed
 */
std::string
ExtractSSH1PublicKey(std::span<const std::byte> contents) noexcept;
