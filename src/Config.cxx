// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Config.hxx"
#include "ConfigLineParser.hxx"
#include "FileInfo.hxx"
#include "StringUtil.hxx"
#include "system/Error.hxx"

#include <fmt/core.h>

#include <stdexcept>
#include <thread>

#include <unistd.h>

using std::string_view_literals::operator""sv;

static constexpr std::size_t MAX_CONFIG_FILE_SIZE = 1024 * 1024;

void
Config::Check()
{
	if (exclude.empty())
		exclude = {"/proc", "/sys", "/dev", "/run"};

	if (min_size > max_size)
		throw std::runtime_error{"min_size is larger than max_size"};

	if (read_limit == 0)
		throw std::runtime_error{"read_limit must not be zero"};

	if (jobs == 0) {
		jobs = std::thread::hardware_concurrency();
		if (jobs == 0)
			jobs = 1;
	}

	if (root.empty())
		root = "/";
}

ScanMode
ParseScanMode(std::string_view s)
{
	if (s == "home"sv)
		return ScanMode::HOME;
	else if (s == "full"sv)
		return ScanMode::FULL;
	else
		throw ConfigLineParser::Error{"Unknown scan mode"};
}

static std::string
ExpectAbsolutePath(ConfigLineParser &line)
{
	auto value = line.ExpectValueAndEnd();
	if (!value.starts_with('/'))
		throw ConfigLineParser::Error{"Absolute path expected"};
	return value;
}

void
ParseConfigLine(Config &config, std::string_view _line)
{
	ConfigLineParser line{_line};
	if (line.IsEnd())
		return;

	const auto word = line.ExpectWord();

	if (word == "mode"sv) {
		config.mode = ParseScanMode(line.ExpectValueAndEnd());
	} else if (word == "root"sv) {
		config.root = ExpectAbsolutePath(line);
	} else if (word == "min_size"sv) {
		config.min_size = line.NextUnsigned();
		line.ExpectEnd();
	} else if (word == "max_size"sv) {
		config.max_size = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (word == "exclude"sv) {
		config.exclude.emplace_back(ExpectAbsolutePath(line));
	} else if (word == "read_limit"sv) {
		config.read_limit = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (word == "jobs"sv) {
		config.jobs = static_cast<unsigned>(line.NextPositiveInteger());
		line.ExpectEnd();
	} else if (word == "tool_timeout"sv) {
		config.tool_timeout = std::chrono::seconds{line.NextPositiveInteger()};
		line.ExpectEnd();
	} else if (word == "ssh_keygen"sv) {
		config.ssh_keygen = ExpectAbsolutePath(line);
	} else if (word == "ssh_add"sv) {
		config.ssh_add = ExpectAbsolutePath(line);
	} else if (word == "private_keys"sv) {
		config.private_keys = line.NextBool();
		line.ExpectEnd();
	} else if (word == "authorized_keys"sv) {
		config.authorized_keys = line.NextBool();
		line.ExpectEnd();
	} else if (word == "agents"sv) {
		config.agents = line.NextBool();
		line.ExpectEnd();
	} else if (word == "verbose"sv) {
		config.verbose = static_cast<unsigned>(line.NextUnsigned());
		line.ExpectEnd();
	} else
		throw ConfigLineParser::Error{"Unknown option"};
}

void
LoadConfigFile(Config &config, const char *path, bool must_exist)
{
	if (must_exist && access(path, F_OK) < 0) {
		const int e = errno;
		throw MakeErrno(e, fmt::format("Failed to open {}", path).c_str());
	}

	const auto contents = ReadSmallTextFile(path, MAX_CONFIG_FILE_SIZE);

	LineSplitter lines{contents};
	unsigned no = 0;
	while (const auto line = lines.Next()) {
		++no;

		try {
			ParseConfigLine(config, *line);
		} catch (...) {
			std::throw_with_nested(std::runtime_error{fmt::format("{}:{}", path, no)});
		}
	}
}
