// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "BN.hxx"

#include <cstddef>
#include <span>

/**
 * Convert a SSH "mpint" (RFC 4251 section 5) to a BIGNUM.  Throws
 * std::invalid_argument on negative or oversized values.
 */
UniqueBIGNUM
DeserializeBIGNUM(std::span<const std::byte> src);

/**
 * Like DeserializeBIGNUM(), but only determine the number of
 * significant bits.
 */
unsigned
CountBIGNUMBits(std::span<const std::byte> src);
