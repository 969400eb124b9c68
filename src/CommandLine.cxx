// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "ConfigLineParser.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <getopt.h>

enum {
	OPTION_MIN_SIZE = 0x100,
	OPTION_MAX_SIZE,
	OPTION_NO_PRIVATE_KEYS,
	OPTION_NO_AUTHORIZED_KEYS,
	OPTION_NO_AGENTS,
};

static constexpr struct option long_options[] = {
	{"config", required_argument, nullptr, 'c'},
	{"mode", required_argument, nullptr, 'm'},
	{"root", required_argument, nullptr, 'r'},
	{"min-size", required_argument, nullptr, OPTION_MIN_SIZE},
	{"max-size", required_argument, nullptr, OPTION_MAX_SIZE},
	{"jobs", required_argument, nullptr, 'j'},
	{"timeout", required_argument, nullptr, 't'},
	{"verbose", no_argument, nullptr, 'v'},
	{"quiet", no_argument, nullptr, 'q'},
	{"no-private-keys", no_argument, nullptr, OPTION_NO_PRIVATE_KEYS},
	{"no-authorized-keys", no_argument, nullptr, OPTION_NO_AUTHORIZED_KEYS},
	{"no-agents", no_argument, nullptr, OPTION_NO_AGENTS},
	{"help", no_argument, nullptr, 'h'},
	{nullptr, 0, nullptr, 0},
};

/**
 * Wrap a #ConfigLineParser::Error with the option name.
 */
template<typename F>
static auto
ParseOptionValue(const char *name, const char *value, F &&f)
{
	try {
		return f(value);
	} catch (const ConfigLineParser::Error &e) {
		throw std::runtime_error{fmt::format("Bad value for {}: {}",
						     name, e.what())};
	}
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	/* reinitialize getopt (for the unit tests) */
	optind = 0;
	opterr = 0;

	int o;
	while ((o = getopt_long(argc, argv, ":c:m:r:j:t:vqh",
				long_options, nullptr)) != -1) {
		switch (o) {
		case 'c':
			cmdline.config_path = optarg;
			cmdline.explicit_config_path = true;
			break;

		case 'm':
			cmdline.mode = ParseOptionValue("--mode", optarg,
							ParseScanMode);
			break;

		case 'r':
			if (*optarg != '/')
				throw std::runtime_error{"--root requires an absolute path"};
			cmdline.root = optarg;
			break;

		case OPTION_MIN_SIZE:
			cmdline.min_size = ParseOptionValue("--min-size", optarg,
							    ParseUnsigned);
			break;

		case OPTION_MAX_SIZE:
			cmdline.max_size = ParseOptionValue("--max-size", optarg,
							    ParsePositiveInteger);
			break;

		case 'j':
			cmdline.jobs = static_cast<unsigned>(ParseOptionValue("--jobs", optarg,
									      ParsePositiveInteger));
			break;

		case 't':
			cmdline.tool_timeout = std::chrono::seconds{
				ParseOptionValue("--timeout", optarg,
						 ParsePositiveInteger)
			};
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case 'q':
			cmdline.quiet = true;
			break;

		case OPTION_NO_PRIVATE_KEYS:
			cmdline.no_private_keys = true;
			break;

		case OPTION_NO_AUTHORIZED_KEYS:
			cmdline.no_authorized_keys = true;
			break;

		case OPTION_NO_AGENTS:
			cmdline.no_agents = true;
			break;

		case 'h':
			cmdline.help = true;
			break;

		case ':':
			throw std::runtime_error{fmt::format("Option requires an argument: {}",
							     argv[optind - 1])};

		default:
			throw std::runtime_error{fmt::format("Unknown option: {}",
							     argv[optind - 1])};
		}
	}

	if (optind < argc)
		throw std::runtime_error{fmt::format("Unexpected argument: {}",
						     argv[optind])};

	return cmdline;
}

void
CommandLine::ApplyTo(Config &config) const noexcept
{
	if (mode)
		config.mode = *mode;

	if (root)
		config.root = *root;

	if (min_size)
		config.min_size = *min_size;

	if (max_size)
		config.max_size = *max_size;

	if (jobs)
		config.jobs = *jobs;

	if (tool_timeout)
		config.tool_timeout = *tool_timeout;

	if (quiet)
		config.verbose = 0;
	config.verbose += verbose;

	if (no_private_keys)
		config.private_keys = false;

	if (no_authorized_keys)
		config.authorized_keys = false;

	if (no_agents)
		config.agents = false;
}

void
PrintUsage(FILE *file, const char *program)
{
	fmt::print(file,
		   "Usage: {} [OPTIONS]\n"
		   "\n"
		   "Options:\n"
		   "  -c, --config PATH        load this configuration file\n"
		   "  -m, --mode home|full     scan home directories or the whole file system\n"
		   "  -r, --root PATH          root directory of the scanned system\n"
		   "      --min-size N         minimum file size (full mode)\n"
		   "      --max-size N         maximum file size (full mode)\n"
		   "  -j, --jobs N             number of worker threads\n"
		   "  -t, --timeout SECONDS    timeout for ssh-keygen and ssh-add\n"
		   "  -v, --verbose            more log messages (repeatable)\n"
		   "  -q, --quiet              log errors only\n"
		   "      --no-private-keys    skip the private key inventory\n"
		   "      --no-authorized-keys skip the authorized keys inventory\n"
		   "      --no-agents          skip the SSH agent inventory\n"
		   "  -h, --help               show this help\n",
		   program);
}
