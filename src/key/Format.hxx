// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Verdict.hxx"

#include <cstddef>
#include <span>

/**
 * Determine the container format from the first two non-empty
 * lines of the given file contents.  Only a bounded prefix is
 * inspected.
 */
[[gnu::pure]]
KeyFormat
ClassifyKeyFile(std::span<const std::byte> contents) noexcept;
