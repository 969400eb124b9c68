// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

inline std::string_view
AsStringView(std::span<const std::byte> s) noexcept
{
	return {reinterpret_cast<const char *>(s.data()), s.size()};
}

inline std::span<const std::byte>
AsByteSpan(std::string_view s) noexcept
{
	return {reinterpret_cast<const std::byte *>(s.data()), s.size()};
}
