// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "WorkerPool.hxx"
#include "system/Error.hxx"

#include <algorithm>
#include <system_error>

WorkerPool::WorkerPool(std::size_t n_threads)
	:max_queue(std::max<std::size_t>(n_threads, 1) * 4)
{
	n_threads = std::max<std::size_t>(n_threads, 1);

	threads.reserve(n_threads);

	try {
		for (std::size_t i = 0; i < n_threads; ++i)
			threads.emplace_back([this]{ Run(); });
	} catch (const std::system_error &e) {
		Join();
		throw ResourceError{e.code(), "Failed to create worker thread"};
	}
}

WorkerPool::~WorkerPool() noexcept
{
	DiscardPending();
	Join();
}

void
WorkerPool::Join() noexcept
{
	{
		const std::scoped_lock lock{mutex};
		finishing = true;
	}

	job_cond.notify_all();

	for (auto &i : threads)
		if (i.joinable())
			i.join();
}

bool
WorkerPool::Submit(std::function<void()> job)
{
	std::unique_lock lock{mutex};
	space_cond.wait(lock, [this]{
		return error || queue.size() < max_queue;
	});

	if (error)
		return false;

	queue.emplace_back(std::move(job));
	lock.unlock();

	job_cond.notify_one();
	return true;
}

void
WorkerPool::Finish()
{
	Join();

	if (error)
		std::rethrow_exception(error);
}

void
WorkerPool::DiscardPending() noexcept
{
	const std::scoped_lock lock{mutex};
	queue.clear();
	space_cond.notify_all();
}

void
WorkerPool::Run() noexcept
{
	std::unique_lock lock{mutex};

	while (true) {
		job_cond.wait(lock, [this]{
			return finishing || !queue.empty();
		});

		if (queue.empty() || error)
			/* finishing and nothing left to do */
			break;

		auto job = std::move(queue.front());
		queue.pop_front();
		space_cond.notify_one();

		lock.unlock();

		try {
			job();
		} catch (...) {
			lock.lock();
			if (!error)
				error = std::current_exception();
			queue.clear();
			space_cond.notify_all();
			continue;
		}

		lock.lock();
	}
}
