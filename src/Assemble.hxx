// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Report.hxx"

struct CandidateFile;
struct DecodeResult;

/**
 * Merge file metadata, decoder verdict and public key into one
 * report.  A missing key type is derived from the leading
 * algorithm token of the public key line, or from the container
 * format.
 */
KeyReport
AssembleKeyReport(const CandidateFile &file, const DecodeResult &decoded,
		  PublicKeyRecord key);
