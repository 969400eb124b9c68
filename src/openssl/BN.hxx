// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Error.hxx"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct BIGNUMDeleter {
	void operator()(BIGNUM *bn) const noexcept {
		BN_clear_free(bn);
	}
};

using UniqueBIGNUM = std::unique_ptr<BIGNUM, BIGNUMDeleter>;

inline UniqueBIGNUM
NewUniqueBIGNUM()
{
	auto *bn = BN_new();
	if (bn == nullptr)
		throw SslError{"BN_new() failed"};

	return UniqueBIGNUM{bn};
}

inline UniqueBIGNUM
BN_bin2bn(std::span<const std::byte> src)
{
	auto bn = NewUniqueBIGNUM();
	if (BN_bin2bn(reinterpret_cast<const unsigned char *>(src.data()),
		      src.size(), bn.get()) == nullptr)
		throw SslError{"BN_bin2bn() failed"};
	return bn;
}

/**
 * Parse a decimal number.  Returns nullptr if the string is not a
 * valid non-negative decimal number.
 */
inline UniqueBIGNUM
BN_dec2bn(const std::string &src)
{
	if (src.empty() || src.find_first_not_of("0123456789") != src.npos)
		return nullptr;

	BIGNUM *bn = nullptr;
	if (BN_dec2bn(&bn, src.c_str()) != static_cast<int>(src.size()))
		throw SslError{"BN_dec2bn() failed"};

	return UniqueBIGNUM{bn};
}

inline std::string
BN_bn2dec(const BIGNUM &bn)
{
	char *s = BN_bn2dec(&bn);
	if (s == nullptr)
		throw SslError{"BN_bn2dec() failed"};

	std::string result{s};
	OPENSSL_free(s);
	return result;
}

/**
 * Serialize the magnitude as big-endian bytes without leading
 * zeroes.
 */
inline std::vector<std::byte>
BN_bn2bin(const BIGNUM &bn)
{
	std::vector<std::byte> result(BN_num_bytes(&bn));
	BN_bn2bin(&bn, reinterpret_cast<unsigned char *>(result.data()));
	return result;
}
