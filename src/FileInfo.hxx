// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "SecretBuffer.hxx"

#include <cstddef>
#include <ctime>
#include <string>

struct stat;

/**
 * Ownership and permission information of a file, as it appears
 * in an output record.
 */
struct FileMetadata {
	/**
	 * The owner's user name, or the numeric uid if the user is
	 * unknown.
	 */
	std::string owner;

	std::string group;

	/**
	 * The permission bits (including setuid/setgid/sticky).
	 */
	unsigned mode = 0;

	std::time_t mtime = 0;
};

FileMetadata
MakeFileMetadata(const struct stat &st);

/**
 * Obtain metadata of the given path, following symlinks.  Throws
 * on error.
 */
FileMetadata
LoadFileMetadata(const char *path);

/**
 * A file which may contain a private key: its metadata and (a
 * bounded prefix of) its contents.
 */
struct CandidateFile {
	std::string path;

	FileMetadata metadata;

	SecretBuffer contents;
};

/**
 * Open a regular file and read at most #read_limit bytes.  Never
 * blocks on FIFOs or devices; throws if the path is not a regular
 * file or cannot be read.
 */
CandidateFile
LoadCandidateFile(std::string path, std::size_t read_limit);

/**
 * Read a small text file (e.g. a companion ".pub" file)
 * completely.  Returns an empty string if the file does not exist;
 * throws on other errors or if the file is larger than #max_size.
 */
std::string
ReadSmallTextFile(const char *path, std::size_t max_size);

/**
 * Read a file until end-of-file, but at most #max_size bytes.
 * Unlike ReadSmallTextFile(), this works with files which do not
 * report their size (e.g. in /proc).  Throws on error.
 */
std::string
ReadFileLimited(const char *path, std::size_t max_size);
