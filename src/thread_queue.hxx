// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "thread_job.hxx"

#include <boost/intrusive/list.hpp>

#include <condition_variable>
#include <mutex>

/**
 * A queue of #ThreadJob instances shared by worker threads and the
 * threads which submit jobs and wait for them.
 */
class ThreadQueue {
	std::mutex mutex;

	/**
	 * Signalled when a job is added or the queue is stopped.
	 */
	std::condition_variable cond;

	/**
	 * Signalled when a job finishes.
	 */
	std::condition_variable done_cond;

	bool alive = true;

	using JobList =
		boost::intrusive::list<ThreadJob,
				       boost::intrusive::constant_time_size<false>>;

	JobList waiting, busy;

public:
	ThreadQueue() = default;
	~ThreadQueue() noexcept;

	ThreadQueue(const ThreadQueue &) = delete;
	ThreadQueue &operator=(const ThreadQueue &) = delete;

	/**
	 * Stop the queue: workers return from Wait() with nullptr.
	 * Jobs still waiting are removed and marked done.
	 */
	void Stop() noexcept;

	/**
	 * Enqueue a job.  It must be idle.
	 */
	void Add(ThreadJob &job) noexcept;

	/**
	 * Dequeue a job and mark it busy; blocks until a job is
	 * available.  Returns nullptr after Stop().  Called by worker
	 * threads.
	 */
	ThreadJob *Wait() noexcept;

	/**
	 * Mark the job done.  Called by worker threads after Run().
	 */
	void Done(ThreadJob &job) noexcept;

	/**
	 * Block until the given job is done, and reset it to idle.
	 */
	void WaitDone(ThreadJob &job) noexcept;

	/**
	 * Remove a job which has not been started yet.
	 *
	 * @return true if the job is now idle, false if a worker is
	 * busy with it (or has finished it) and WaitDone() must be
	 * called
	 */
	bool Cancel(ThreadJob &job) noexcept;
};
