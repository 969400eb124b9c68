// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <mutex>
#include <string_view>

#include <stdio.h>

/**
 * Writes complete output records to a stream.  May be used from
 * multiple threads; records never interleave.
 */
class RecordWriter {
	FILE *const file;

	std::mutex mutex;

	std::size_t n_records = 0;

public:
	explicit RecordWriter(FILE *_file) noexcept
		:file(_file) {}

	RecordWriter(const RecordWriter &) = delete;
	RecordWriter &operator=(const RecordWriter &) = delete;

	/**
	 * Write one record followed by a newline and flush the
	 * stream.  Throws on I/O error.
	 */
	void Write(std::string_view record);

	std::size_t GetRecordCount() noexcept {
		const std::scoped_lock lock{mutex};
		return n_records;
	}
};
