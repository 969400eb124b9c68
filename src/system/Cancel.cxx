// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Cancel.hxx"

#include <atomic>
#include <system_error>

#include <signal.h>

static std::atomic_bool cancel_requested{false};

static_assert(std::atomic_bool::is_always_lock_free);

static void
OnCancelSignal(int) noexcept
{
	cancel_requested.store(true, std::memory_order_relaxed);
}

void
InstallCancelSignals()
{
	struct sigaction sa{};
	sa.sa_handler = OnCancelSignal;
	sigemptyset(&sa.sa_mask);

	for (const int signo : {SIGINT, SIGTERM, SIGHUP})
		if (sigaction(signo, &sa, nullptr) < 0)
			throw std::system_error{errno, std::system_category(),
						"sigaction() failed"};

	sa.sa_handler = SIG_IGN;
	if (sigaction(SIGPIPE, &sa, nullptr) < 0)
		throw std::system_error{errno, std::system_category(),
					"sigaction() failed"};
}

bool
IsCancelRequested() noexcept
{
	return cancel_requested.load(std::memory_order_relaxed);
}

void
RequestCancel() noexcept
{
	cancel_requested.store(true, std::memory_order_relaxed);
}
