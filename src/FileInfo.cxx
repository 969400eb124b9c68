// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "FileInfo.hxx"
#include "system/Error.hxx"
#include "system/UniqueFd.hxx"

#include <array>
#include <stdexcept>

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>

static std::string
LookupUserName(uid_t uid)
{
	std::array<char, 4096> buffer;
	struct passwd pw, *result;
	if (getpwuid_r(uid, &pw, buffer.data(), buffer.size(), &result) == 0 &&
	    result != nullptr)
		return pw.pw_name;

	return std::to_string(uid);
}

static std::string
LookupGroupName(gid_t gid)
{
	std::array<char, 4096> buffer;
	struct group gr, *result;
	if (getgrgid_r(gid, &gr, buffer.data(), buffer.size(), &result) == 0 &&
	    result != nullptr)
		return gr.gr_name;

	return std::to_string(gid);
}

FileMetadata
MakeFileMetadata(const struct stat &st)
{
	return {
		.owner = LookupUserName(st.st_uid),
		.group = LookupGroupName(st.st_gid),
		.mode = static_cast<unsigned>(st.st_mode & 07777),
		.mtime = st.st_mtime,
	};
}

FileMetadata
LoadFileMetadata(const char *path)
{
	struct stat st;
	if (stat(path, &st) < 0)
		throw MakeErrno("Failed to stat file");

	return MakeFileMetadata(st);
}

static std::size_t
ReadFull(int fd, std::span<std::byte> dest)
{
	std::size_t position = 0;

	while (position < dest.size()) {
		const auto nbytes = read(fd, dest.data() + position,
					 dest.size() - position);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to read file");
		}

		if (nbytes == 0)
			break;

		position += static_cast<std::size_t>(nbytes);
	}

	return position;
}

CandidateFile
LoadCandidateFile(std::string path, std::size_t read_limit)
{
	/* O_NONBLOCK: don't hang on FIFOs which were replaced
	   after the scanner saw a regular file */
	UniqueFd fd{open(path.c_str(),
				    O_RDONLY|O_NOCTTY|O_NONBLOCK|O_CLOEXEC)};
	if (!fd.IsDefined())
		throw MakeErrno("Failed to open file");

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw MakeErrno("Failed to stat file");

	if (!S_ISREG(st.st_mode))
		throw std::runtime_error{"Not a regular file"};

	const std::size_t size = static_cast<std::size_t>(st.st_size) < read_limit
		? static_cast<std::size_t>(st.st_size)
		: read_limit;

	SecretBuffer contents{size};
	contents.SetSize(ReadFull(fd.Get(), contents.Write()));

	return {
		.path = std::move(path),
		.metadata = MakeFileMetadata(st),
		.contents = std::move(contents),
	};
}

std::string
ReadSmallTextFile(const char *path, std::size_t max_size)
{
	UniqueFd fd{open(path, O_RDONLY|O_NOCTTY|O_NONBLOCK|O_CLOEXEC)};
	if (!fd.IsDefined()) {
		if (const int e = errno; e != ENOENT)
			throw MakeErrno(e, "Failed to open file");

		return {};
	}

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw MakeErrno("Failed to stat file");

	if (!S_ISREG(st.st_mode))
		throw std::runtime_error{"Not a regular file"};

	if (static_cast<std::size_t>(st.st_size) > max_size)
		throw std::runtime_error{"File is too large"};

	std::string result;
	result.resize(static_cast<std::size_t>(st.st_size));

	const std::span<std::byte> dest{reinterpret_cast<std::byte *>(result.data()),
					result.size()};
	result.resize(ReadFull(fd.Get(), dest));
	return result;
}

std::string
ReadFileLimited(const char *path, std::size_t max_size)
{
	UniqueFd fd{open(path, O_RDONLY|O_NOCTTY|O_NONBLOCK|O_CLOEXEC)};
	if (!fd.IsDefined())
		throw MakeErrno("Failed to open file");

	std::string result;
	result.resize(max_size);

	const std::span<std::byte> dest{reinterpret_cast<std::byte *>(result.data()),
					result.size()};
	result.resize(ReadFull(fd.Get(), dest));
	return result;
}
