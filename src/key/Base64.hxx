// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "SecretBuffer.hxx"

#include <optional>
#include <string_view>

/**
 * Decode standard (padded) base64.  Returns std::nullopt on
 * malformed input.
 */
std::optional<SecretBuffer>
DecodeBase64(std::string_view src);

/**
 * Like DecodeBase64(), but skip whitespace (including line
 * breaks) anywhere in the input.
 */
std::optional<SecretBuffer>
DecodeBase64IgnoreWhitespace(std::string_view src);
