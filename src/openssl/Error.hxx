// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <openssl/err.h>

#include <stdexcept>
#include <string>

/**
 * An OpenSSL library call failed.  The message includes the most
 * recent entry of the OpenSSL error queue.
 */
class SslError : public std::runtime_error {
public:
	explicit SslError(const char *msg)
		:std::runtime_error(Format(msg)) {}

private:
	static std::string Format(const char *msg) {
		std::string result{msg};

		if (const unsigned long code = ERR_get_error(); code != 0) {
			char buffer[256];
			ERR_error_string_n(code, buffer, sizeof(buffer));
			result += ": ";
			result += buffer;
		}

		ERR_clear_error();
		return result;
	}
};
