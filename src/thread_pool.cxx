// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "thread_pool.hxx"
#include "thread_worker.hxx"

WorkerPool::~WorkerPool() noexcept
{
	Stop();
}

ThreadQueue &
WorkerPool::Get()
{
	const std::scoped_lock lock{mutex};

	if (!started) {
		/* initial call: launch worker threads */
		started = true;

		try {
			for (unsigned i = 0; i < n_threads; ++i)
				workers.emplace_front(queue);
		} catch (...) {
			StopLocked();
			throw;
		}
	}

	return queue;
}

void
WorkerPool::Stop() noexcept
{
	const std::scoped_lock lock{mutex};
	StopLocked();
}

void
WorkerPool::StopLocked() noexcept
{
	queue.Stop();

	for (auto &i : workers)
		i.Join();
	workers.clear();
}
