// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Scan.hxx"
#include "Passwd.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "system/Cancel.hxx"

#include <fmt/core.h>

#include <algorithm>

#include <unistd.h>

static void
CheckScanRoot(const std::filesystem::path &root)
{
	std::error_code ec;
	if (!std::filesystem::is_directory(root, ec) ||
	    access(root.c_str(), R_OK|X_OK) < 0)
		throw ScanRootError{fmt::format("Scan root {} is not readable",
						root.native())};
}

void
ScanFileSystem(const FullScanConfig &config, const CandidateHandler &handler)
{
	CheckScanRoot(config.root);

	std::vector<std::filesystem::path> exclude;
	exclude.reserve(config.exclude.size());
	for (const auto &i : config.exclude) {
		auto p = MakeRootedPath(config.root, i).lexically_normal();
		if (!p.has_filename())
			/* trailing slash */
			p = p.parent_path();
		exclude.emplace_back(std::move(p));
	}

	const auto IsExcluded = [&exclude](const std::filesystem::path &path){
		return std::find(exclude.begin(), exclude.end(),
				 path.lexically_normal()) != exclude.end();
	};

	std::error_code ec;
	std::filesystem::recursive_directory_iterator i{
		config.root,
		std::filesystem::directory_options::skip_permission_denied,
		ec,
	};
	if (ec)
		throw ScanRootError{fmt::format("Failed to open {}: {}",
						config.root.native(), ec.message())};

	for (; i != std::filesystem::recursive_directory_iterator{}; i.increment(ec)) {
		if (IsCancelRequested())
			break;

		const auto &entry = *i;

		std::error_code entry_ec;
		const auto status = entry.symlink_status(entry_ec);
		if (entry_ec)
			continue;

		if (std::filesystem::is_directory(status)) {
			if (IsExcluded(entry.path()))
				i.disable_recursion_pending();
			continue;
		}

		if (!std::filesystem::is_regular_file(status))
			continue;

		const auto size = entry.file_size(entry_ec);
		if (entry_ec || size < config.min_size || size > config.max_size)
			continue;

		handler(std::string{entry.path().native()});
	}

	if (ec)
		/* the iterator is at its end after an error */
		LogFmt(1, "Traversal of {} aborted: {}",
		       config.root.native(), ec.message());
}
