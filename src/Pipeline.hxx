// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Report.hxx"

#include <cstddef>
#include <optional>
#include <string>

class KeyTool;
struct CandidateFile;

struct PipelineConfig {
	/**
	 * Read at most this many bytes of each candidate file.
	 */
	std::size_t read_limit = 32768;
};

/**
 * Process a candidate file whose contents have already been read:
 * classify, decode, derive and reconcile.
 *
 * @return the report or std::nullopt if the file is not a private
 * key or no public key could be established
 */
std::optional<KeyReport>
ProcessCandidateFile(KeyTool &tool, const CandidateFile &file);

/**
 * Like ProcessCandidateFile(), but load the file first.  Errors
 * concerning this file are logged and swallowed; only
 * #ResourceError is thrown.
 */
std::optional<KeyReport>
ProcessCandidatePath(KeyTool &tool, const PipelineConfig &config,
		     std::string path);
