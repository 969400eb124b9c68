// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <span>

static constexpr std::size_t MD5_DIGEST_SIZE = 16;

using MD5Digest = std::array<std::byte, MD5_DIGEST_SIZE>;

/**
 * Calculate the MD5 digest of the concatenation of all given
 * buffers.  Throws SslError on error (e.g. if MD5 is disabled by
 * the OpenSSL configuration).
 */
MD5Digest
CalcMD5(std::initializer_list<std::span<const std::byte>> src);
