// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Log.hxx"
#include "Output.hxx"
#include "Pipeline.hxx"
#include "Report.hxx"
#include "WorkerPool.hxx"
#include "agent/AgentLister.hxx"
#include "agent/AgentSockets.hxx"
#include "auth/AuthorizedKeys.hxx"
#include "scan/Error.hxx"
#include "scan/Passwd.hxx"
#include "scan/Scan.hxx"
#include "system/Cancel.hxx"
#include "system/Error.hxx"
#include "tool/OpenSSHKeyTool.hxx"

#include <filesystem>

#include <stdlib.h>

static constexpr int EXIT_CONFIG = 1;
static constexpr int EXIT_SCAN_ROOT = 2;
static constexpr int EXIT_RESOURCE = 3;
static constexpr int EXIT_CANCELLED = 130;

static void
SubmitAgentJobs(WorkerPool &pool, KeyTool &tool, RecordWriter &output,
		const std::filesystem::path &root)
{
	for (const auto &socket_path : DiscoverAgentSockets(root)) {
		if (IsCancelRequested())
			return;

		const bool ok = pool.Submit([&tool, &output, socket_path]{
			for (const auto &i : ListAgentIdentities(tool, socket_path)) {
				if (IsCancelRequested())
					return;

				output.Write(FormatAgentIdentity(i));
			}
		});

		if (!ok)
			/* a job has failed; this rethrows its error */
			pool.Finish();
	}
}

static void
SubmitPrivateKeyJobs(const Config &config, const PipelineConfig &pipeline,
		     WorkerPool &pool, KeyTool &tool, RecordWriter &output,
		     const std::vector<PasswdEntry> &users)
{
	const CandidateHandler handler = [&](std::string &&path){
		const bool ok = pool.Submit([&pipeline, &tool, &output,
					     path=std::move(path)]{
			const auto report = ProcessCandidatePath(tool, pipeline,
								 path);
			if (report && !IsCancelRequested())
				output.Write(FormatKeyReport(*report));
		});

		if (!ok)
			pool.Finish();
	};

	switch (config.mode) {
	case ScanMode::HOME:
		ScanHomeDirectories(config.root, users, handler);
		break;

	case ScanMode::FULL:
		ScanFileSystem({
				.root = config.root,
				.min_size = config.min_size,
				.max_size = config.max_size,
				.exclude = config.exclude,
			}, handler);
		break;
	}
}

static int
Run(const Config &config)
{
	const std::filesystem::path root{config.root};

	OpenSSHKeyTool tool{{
		.ssh_keygen = config.ssh_keygen,
		.ssh_add = config.ssh_add,
		.timeout = config.tool_timeout,
	}};

	RecordWriter output{stdout};

	const PipelineConfig pipeline{
		.read_limit = config.read_limit,
	};

	std::vector<PasswdEntry> users;
	if (config.private_keys && config.mode == ScanMode::HOME) {
		/* the home scan is impossible without the user
		   database */
		users = LoadPasswd(root);
	} else if (config.authorized_keys) {
		try {
			users = LoadPasswd(root);
		} catch (const ScanRootError &) {
			LogException(1, std::current_exception());
		}
	}

	LogFmt(2, "{} users", users.size());

	/* declared last: the jobs reference everything above */
	WorkerPool pool{config.jobs};

	/* agent queries run in the pool concurrently with the file
	   scan */
	if (config.agents)
		SubmitAgentJobs(pool, tool, output, root);

	if (config.authorized_keys)
		InventoryAuthorizedKeys(root, users,
					[&output](AuthorizedKeyReport &&report){
						output.Write(FormatAuthorizedKeyReport(report));
					});

	if (config.private_keys)
		SubmitPrivateKeyJobs(config, pipeline, pool, tool, output, users);

	if (IsCancelRequested())
		/* no new records after cancellation */
		pool.DiscardPending();

	pool.Finish();

	if (IsCancelRequested()) {
		LogFmt(1, "Cancelled after {} records", output.GetRecordCount());
		return EXIT_CANCELLED;
	}

	LogFmt(2, "{} records", output.GetRecordCount());
	return EXIT_SUCCESS;
}

int
main(int argc, char **argv) noexcept
{
	Config config;

	try {
		const auto cmdline = ParseCommandLine(argc, argv);
		if (cmdline.help) {
			PrintUsage(stdout, argv[0]);
			return EXIT_SUCCESS;
		}

		LoadConfigFile(config, cmdline.config_path,
			       cmdline.explicit_config_path);
		cmdline.ApplyTo(config);
		config.Check();
	} catch (...) {
		LogException(0, std::current_exception());
		fmt::print(stderr, "Try '{} --help' for more information.\n",
			   argv[0]);
		return EXIT_CONFIG;
	}

	log_level = config.verbose;

	try {
		InstallCancelSignals();
		return Run(config);
	} catch (const ScanRootError &) {
		LogException(0, std::current_exception());
		return EXIT_SCAN_ROOT;
	} catch (const ResourceError &) {
		LogException(0, std::current_exception());
		return EXIT_RESOURCE;
	} catch (...) {
		LogException(0, std::current_exception());
		if (IsCancelRequested())
			return EXIT_CANCELLED;
		return EXIT_FAILURE;
	}
}
