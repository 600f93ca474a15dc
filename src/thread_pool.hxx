// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "thread_queue.hxx"
#include "thread_worker.hxx"

#include <forward_list>
#include <mutex>

/**
 * A bounded set of worker threads sharing one #ThreadQueue.  The
 * threads are launched on the first Get() call.
 */
class WorkerPool {
	ThreadQueue queue;

	std::forward_list<ThreadWorker> workers;

	const unsigned n_threads;

	/**
	 * Protects #workers and #started.
	 */
	std::mutex mutex;

	bool started = false;

public:
	explicit WorkerPool(unsigned _n_threads) noexcept
		:n_threads(_n_threads > 0 ? _n_threads : 1) {}

	~WorkerPool() noexcept;

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	unsigned GetThreadCount() const noexcept {
		return n_threads;
	}

	/**
	 * Obtain the queue, launching the worker threads if necessary.
	 *
	 * Throws std::system_error if a thread cannot be created.
	 */
	ThreadQueue &Get();

	/**
	 * Stop the queue and join all threads.
	 */
	void Stop() noexcept;

private:
	void StopLocked() noexcept;
};
