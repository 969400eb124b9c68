// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Log.hxx"

#include <fmt/format.h>

#include <mutex>
#include <stdexcept>
#include <string>

#include <stdio.h>

unsigned log_level = 1;

static std::mutex log_mutex;

void
LogLine(std::string_view line) noexcept
{
	std::string buffer;

	try {
		buffer.reserve(line.size() + 1);
		buffer.append(line);
		buffer.push_back('\n');
	} catch (...) {
		/* out of memory */
		return;
	}

	const std::scoped_lock lock{log_mutex};
	fwrite(buffer.data(), 1, buffer.size(), stderr);
}

void
LogVFmt(unsigned level, fmt::string_view format_str,
	fmt::format_args args) noexcept
try {
	if (!CheckLogLevel(level))
		return;

	LogLine(fmt::vformat(format_str, args));
} catch (...) {
	/* out of memory while formatting; nothing we can do */
}

static std::string
GetFullMessage(std::exception_ptr ep)
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		std::string msg = e.what();

		try {
			std::rethrow_if_nested(e);
		} catch (...) {
			msg += ": ";
			msg += GetFullMessage(std::current_exception());
		}

		return msg;
	} catch (const char *s) {
		return s;
	} catch (...) {
		return "Unknown exception";
	}
}

void
LogException(unsigned level, std::exception_ptr ep) noexcept
try {
	if (CheckLogLevel(level))
		LogLine(GetFullMessage(ep));
} catch (...) {
	/* out of memory while formatting */
}

void
LogException(unsigned level, std::string_view prefix,
	     std::exception_ptr ep) noexcept
try {
	if (CheckLogLevel(level))
		LogLine(fmt::format("{}: {}", prefix, GetFullMessage(ep)));
} catch (...) {
	/* out of memory while formatting */
}
