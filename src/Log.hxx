// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string_view>

/**
 * Messages with a level above this value are discarded.  0 means
 * errors only.
 */
extern unsigned log_level;

inline bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= log_level;
}

/**
 * Write one complete line to stderr.  Lines written by concurrent
 * threads never interleave.
 */
void
LogLine(std::string_view line) noexcept;

void
LogVFmt(unsigned level, fmt::string_view format_str,
	fmt::format_args args) noexcept;

template<typename S, typename... Args>
void
LogFmt(unsigned level, const S &format_str, Args&&... args) noexcept
{
	if (CheckLogLevel(level))
		LogVFmt(level, format_str, fmt::make_format_args(args...));
}

/**
 * Log the message of the given exception and all of its nested
 * exceptions.
 */
void
LogException(unsigned level, std::exception_ptr ep) noexcept;

void
LogException(unsigned level, std::string_view prefix,
	     std::exception_ptr ep) noexcept;
