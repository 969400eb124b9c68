// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/*
 * A synthetic SSH1 private key file: 128 bit modulus 0xc0010203..0f,
 * exponent 65537.
 */

constexpr std::string_view ssh1_modulus_decimal =
	"255217008291310090403581910969557519887";

constexpr std::string_view ssh1_fingerprint =
	"5b:2c:8e:21:06:9e:b0:0f:32:0b:92:c3:98:9b:9e:bb";

inline void
AppendU16(std::string &dest, uint16_t value)
{
	dest.push_back(static_cast<char>(value >> 8));
	dest.push_back(static_cast<char>(value));
}

inline void
AppendU32(std::string &dest, uint32_t value)
{
	AppendU16(dest, static_cast<uint16_t>(value >> 16));
	AppendU16(dest, static_cast<uint16_t>(value));
}

inline void
AppendString(std::string &dest, std::string_view value)
{
	AppendU32(dest, static_cast<uint32_t>(value.size()));
	dest.append(value);
}

/**
 * @param cipher the cipher type byte; 0 means "not encrypted", 3
 * is 3DES
 */
inline std::string
MakeSSH1PrivateKey(unsigned cipher, std::string_view comment="ssh1@example")
{
	std::string result{"SSH PRIVATE KEY FILE FORMAT 1.1\n"};
	result.push_back('\0');
	result.push_back(static_cast<char>(cipher));
	AppendU32(result, 0); // reserved

	AppendU32(result, 128);

	/* n */
	AppendU16(result, 128);
	result.push_back(static_cast<char>(0xc0));
	for (unsigned i = 1; i < 16; ++i)
		result.push_back(static_cast<char>(i));

	/* e */
	AppendU16(result, 17);
	result.append("\x01\x00\x01", 3);

	AppendString(result, comment);

	/* the (possibly encrypted) private part; its contents are
	   never looked at */
	result.append(64, '\x5a');
	return result;
}
