// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <utility>

#include <unistd.h>

/**
 * Owns a file descriptor and closes it on destruction.
 */
class UniqueFd {
	int fd = -1;

public:
	UniqueFd() noexcept = default;

	explicit UniqueFd(int _fd) noexcept:fd(_fd) {}

	UniqueFd(UniqueFd &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFd() noexcept {
		if (fd >= 0)
			close(fd);
	}

	UniqueFd &operator=(UniqueFd &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	void Close() noexcept {
		if (fd >= 0)
			close(std::exchange(fd, -1));
	}
};
