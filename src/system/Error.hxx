// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cerrno>
#include <system_error>

/**
 * A system resource needed to continue the scan (a pipe, a child
 * process, a thread) could not be allocated.  This is fatal to the
 * whole run, unlike errors concerning a single file.
 */
class ResourceError : public std::system_error {
public:
	using std::system_error::system_error;
};

inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error{code, std::system_category(), msg};
}

inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

inline ResourceError
MakeResourceError(const char *msg) noexcept
{
	return ResourceError{errno, std::system_category(), msg};
}
