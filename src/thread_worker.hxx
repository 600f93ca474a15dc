// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <pthread.h>

class ThreadQueue;

/**
 * A thread which runs jobs from a #ThreadQueue until the queue is
 * stopped.
 */
class ThreadWorker {
	ThreadQueue &queue;

	pthread_t thread;

public:
	/**
	 * Launch the thread.
	 *
	 * Throws std::system_error on error.
	 */
	explicit ThreadWorker(ThreadQueue &_queue);

	ThreadWorker(const ThreadWorker &) = delete;
	ThreadWorker &operator=(const ThreadWorker &) = delete;

	/**
	 * Wait for the thread to exit.  The queue must have been
	 * stopped.
	 */
	void Join() noexcept {
		pthread_join(thread, nullptr);
	}

private:
	static void *Run(void *ctx) noexcept;
};
