// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/**
 * A fixed number of threads executing jobs from a bounded queue.
 * The first exception thrown by a job stops the pool; it is
 * rethrown by Finish().
 */
class WorkerPool {
	std::mutex mutex;

	/**
	 * Signalled when a job was added or the pool is finishing.
	 */
	std::condition_variable job_cond;

	/**
	 * Signalled when a job was removed from the queue.
	 */
	std::condition_variable space_cond;

	std::deque<std::function<void()>> queue;

	const std::size_t max_queue;

	std::vector<std::thread> threads;

	std::exception_ptr error;

	bool finishing = false;

public:
	/**
	 * Throws #ResourceError if a thread cannot be created.
	 */
	explicit WorkerPool(std::size_t n_threads);

	/**
	 * Stops and joins all threads, discarding pending jobs.
	 */
	~WorkerPool() noexcept;

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	/**
	 * Add a job to the queue.  Blocks while the queue is full.
	 *
	 * @return false if the pool has stopped (a job has failed)
	 */
	bool Submit(std::function<void()> job);

	/**
	 * Wait for all queued jobs to complete and join all threads.
	 * Rethrows the first exception thrown by a job.
	 */
	void Finish();

	/**
	 * Discard all jobs which have not yet been started.
	 */
	void DiscardPending() noexcept;

private:
	void Run() noexcept;
	void Join() noexcept;
};
