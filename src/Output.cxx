// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Output.hxx"

#include <string>
#include <system_error>

void
RecordWriter::Write(std::string_view record)
{
	std::string line;
	line.reserve(record.size() + 1);
	line.append(record);
	line.push_back('\n');

	const std::scoped_lock lock{mutex};

	if (fwrite(line.data(), 1, line.size(), file) != line.size() ||
	    fflush(file) != 0)
		throw std::system_error{errno, std::system_category(),
					"Failed to write output"};

	++n_records;
}
