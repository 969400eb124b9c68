// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <stdexcept>

/**
 * The scan root (or the user database below it) is not readable;
 * nothing can be scanned.
 */
class ScanRootError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};
