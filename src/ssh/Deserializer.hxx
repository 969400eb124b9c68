// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ByteCast.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace SSH {

struct MalformedPacket {};

/**
 * Reader for the big-endian binary encoding used by SSH key
 * containers and public key blobs (RFC 4251 section 5).  Throws
 * #MalformedPacket if the input is too short.
 */
class Deserializer {
	std::span<const std::byte> src;

public:
	explicit constexpr Deserializer(std::span<const std::byte> _src) noexcept
		:src(_src) {}

	std::span<const std::byte> ReadN(std::size_t size) {
		if (src.size() < size)
			throw MalformedPacket{};
		auto result = src.first(size);
		src = src.subspan(size);
		return result;
	}

	uint_least8_t ReadU8() {
		const auto s = ReadN(1);
		return static_cast<uint_least8_t>(s.front());
	}

	uint_least16_t ReadU16() {
		const auto s = ReadN(2);
		return (static_cast<uint_least16_t>(s[0]) << 8) |
			static_cast<uint_least16_t>(s[1]);
	}

	uint_least32_t ReadU32() {
		const auto s = ReadN(4);
		return (static_cast<uint_least32_t>(s[0]) << 24) |
			(static_cast<uint_least32_t>(s[1]) << 16) |
			(static_cast<uint_least32_t>(s[2]) << 8) |
			static_cast<uint_least32_t>(s[3]);
	}

	std::span<const std::byte> ReadLengthEncoded() {
		return ReadN(ReadU32());
	}

	std::string_view ReadString() {
		return AsStringView(ReadLengthEncoded());
	}

	/**
	 * Read a SSH protocol 1 multi-precision integer: a 16 bit
	 * bit count followed by the big-endian magnitude.
	 */
	std::span<const std::byte> ReadSSH1MPInt() {
		const std::size_t bits = ReadU16();
		return ReadN((bits + 7) / 8);
	}

	bool SkipPrefix(std::string_view prefix) noexcept {
		if (src.size() < prefix.size() ||
		    AsStringView(src.first(prefix.size())) != prefix)
			return false;

		src = src.subspan(prefix.size());
		return true;
	}
};

} // namespace SSH
