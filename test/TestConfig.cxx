// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "TempDirectory.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "ConfigLineParser.hxx"

#include <gtest/gtest.h>

#include <string>
#include <system_error>
#include <vector>

using std::string_view_literals::operator""sv;

TEST(Config, ParseLine)
{
	Config config;

	ParseConfigLine(config, ""sv);
	ParseConfigLine(config, "   # comment"sv);
	ParseConfigLine(config, "mode full"sv);
	ParseConfigLine(config, "root /mnt/image  # the image"sv);
	ParseConfigLine(config, "min_size 0"sv);
	ParseConfigLine(config, "max_size 65536"sv);
	ParseConfigLine(config, "exclude /proc"sv);
	ParseConfigLine(config, "exclude \"/var/lib/with space\""sv);
	ParseConfigLine(config, "read_limit 4096"sv);
	ParseConfigLine(config, "jobs 3"sv);
	ParseConfigLine(config, "tool_timeout 5"sv);
	ParseConfigLine(config, "ssh_keygen /opt/bin/ssh-keygen"sv);
	ParseConfigLine(config, "ssh_add /opt/bin/ssh-add"sv);
	ParseConfigLine(config, "private_keys yes"sv);
	ParseConfigLine(config, "authorized_keys off"sv);
	ParseConfigLine(config, "agents no"sv);
	ParseConfigLine(config, "verbose 3"sv);

	EXPECT_EQ(config.mode, ScanMode::FULL);
	EXPECT_EQ(config.root, "/mnt/image"sv);
	EXPECT_EQ(config.min_size, 0U);
	EXPECT_EQ(config.max_size, 65536U);
	EXPECT_EQ(config.exclude,
		  (std::vector<std::string>{"/proc", "/var/lib/with space"}));
	EXPECT_EQ(config.read_limit, 4096U);
	EXPECT_EQ(config.jobs, 3U);
	EXPECT_EQ(config.tool_timeout, std::chrono::seconds{5});
	EXPECT_EQ(config.ssh_keygen, "/opt/bin/ssh-keygen"sv);
	EXPECT_EQ(config.ssh_add, "/opt/bin/ssh-add"sv);
	EXPECT_TRUE(config.private_keys);
	EXPECT_FALSE(config.authorized_keys);
	EXPECT_FALSE(config.agents);
	EXPECT_EQ(config.verbose, 3U);
}

TEST(Config, ParseLineErrors)
{
	Config config;

	EXPECT_THROW(ParseConfigLine(config, "foo bar"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "mode"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "mode partial"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "mode home extra"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "root relative/path"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "max_size 0"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "min_size -1"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "jobs many"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "agents maybe"sv), ConfigLineParser::Error);
	EXPECT_THROW(ParseConfigLine(config, "exclude \"/unterminated"sv), ConfigLineParser::Error);
}

TEST(Config, Check)
{
	Config config;
	config.Check();

	EXPECT_EQ(config.exclude,
		  (std::vector<std::string>{"/proc", "/sys", "/dev", "/run"}));
	EXPECT_GT(config.jobs, 0U);

	config.min_size = 1000;
	config.max_size = 999;
	EXPECT_THROW(config.Check(), std::runtime_error);

	config = {};
	config.read_limit = 0;
	EXPECT_THROW(config.Check(), std::runtime_error);
}

TEST(Config, LoadFile)
{
	const TempDirectory tmp;

	Config config;
	const auto path = tmp.WriteFile("keysurvey.conf",
					"# keysurvey\n"
					"mode full\n"
					"\n"
					"jobs 2\n");
	LoadConfigFile(config, path.c_str());
	EXPECT_EQ(config.mode, ScanMode::FULL);
	EXPECT_EQ(config.jobs, 2U);

	const auto bad = tmp.WriteFile("bad.conf",
				       "mode home\n"
				       "bogus 1\n");

	try {
		LoadConfigFile(config, bad.c_str());
		FAIL();
	} catch (const std::runtime_error &e) {
		/* the outer exception names the location, the nested
		   one the problem */
		EXPECT_EQ(e.what(), bad + ":2");
		EXPECT_THROW(std::rethrow_if_nested(e), ConfigLineParser::Error);
	}

	const auto missing = (tmp / "missing.conf").native();
	EXPECT_THROW(LoadConfigFile(config, missing.c_str()), std::system_error);
	EXPECT_NO_THROW(LoadConfigFile(config, missing.c_str(), false));
}

/**
 * Helper which provides a mutable argv array.
 */
class Arguments {
	std::vector<std::string> strings;
	std::vector<char *> pointers;

public:
	Arguments(std::initializer_list<const char *> args)
		:strings(args.begin(), args.end()) {
		for (auto &i : strings)
			pointers.push_back(i.data());
		pointers.push_back(nullptr);
	}

	int GetArgc() const noexcept {
		return static_cast<int>(strings.size());
	}

	char **GetArgv() noexcept {
		return pointers.data();
	}
};

static CommandLine
Parse(std::initializer_list<const char *> args)
{
	Arguments a{args};
	return ParseCommandLine(a.GetArgc(), a.GetArgv());
}

TEST(CommandLine, Defaults)
{
	const auto cmdline = Parse({"keysurvey"});
	EXPECT_FALSE(cmdline.explicit_config_path);
	EXPECT_FALSE(cmdline.help);

	Config config;
	cmdline.ApplyTo(config);
	EXPECT_EQ(config.mode, ScanMode::HOME);
	EXPECT_EQ(config.root, "/"sv);
	EXPECT_EQ(config.verbose, 1U);
	EXPECT_TRUE(config.private_keys);
	EXPECT_TRUE(config.authorized_keys);
	EXPECT_TRUE(config.agents);
}

TEST(CommandLine, Options)
{
	const auto cmdline = Parse({
		"keysurvey",
		"-c", "/tmp/test.conf",
		"--mode=full",
		"-r", "/mnt/image",
		"--min-size", "100",
		"--max-size=5000",
		"-j", "4",
		"--timeout", "30",
		"-vv",
		"--no-agents",
		"--no-authorized-keys",
	});

	EXPECT_STREQ(cmdline.config_path, "/tmp/test.conf");
	EXPECT_TRUE(cmdline.explicit_config_path);

	Config config;
	config.agents = true;
	cmdline.ApplyTo(config);
	EXPECT_EQ(config.mode, ScanMode::FULL);
	EXPECT_EQ(config.root, "/mnt/image"sv);
	EXPECT_EQ(config.min_size, 100U);
	EXPECT_EQ(config.max_size, 5000U);
	EXPECT_EQ(config.jobs, 4U);
	EXPECT_EQ(config.tool_timeout, std::chrono::seconds{30});
	EXPECT_EQ(config.verbose, 3U);
	EXPECT_TRUE(config.private_keys);
	EXPECT_FALSE(config.authorized_keys);
	EXPECT_FALSE(config.agents);
}

TEST(CommandLine, OverridesConfigFile)
{
	Config config;
	ParseConfigLine(config, "mode full"sv);
	ParseConfigLine(config, "jobs 8"sv);
	ParseConfigLine(config, "verbose 2"sv);

	Parse({"keysurvey", "-m", "home", "-q"}).ApplyTo(config);
	EXPECT_EQ(config.mode, ScanMode::HOME);
	EXPECT_EQ(config.jobs, 8U);
	EXPECT_EQ(config.verbose, 0U);
}

TEST(CommandLine, Help)
{
	EXPECT_TRUE(Parse({"keysurvey", "--help"}).help);
	EXPECT_TRUE(Parse({"keysurvey", "-h"}).help);
}

TEST(CommandLine, Errors)
{
	EXPECT_THROW(Parse({"keysurvey", "--bogus"}), std::runtime_error);
	EXPECT_THROW(Parse({"keysurvey", "-x"}), std::runtime_error);
	EXPECT_THROW(Parse({"keysurvey", "-m"}), std::runtime_error);
	EXPECT_THROW(Parse({"keysurvey", "-m", "partial"}), std::runtime_error);
	EXPECT_THROW(Parse({"keysurvey", "-r", "relative"}), std::runtime_error);
	EXPECT_THROW(Parse({"keysurvey", "-j", "0"}), std::runtime_error);
	EXPECT_THROW(Parse({"keysurvey", "--max-size", "big"}), std::runtime_error);
	EXPECT_THROW(Parse({"keysurvey", "extra"}), std::runtime_error);
}
