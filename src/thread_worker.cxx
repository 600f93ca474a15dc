// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "thread_worker.hxx"
#include "thread_queue.hxx"
#include "thread_job.hxx"
#include "system/Error.hxx"

void *
ThreadWorker::Run(void *ctx) noexcept
{
	/* reduce glibc's thread cancellation overhead */
	pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, nullptr);

	auto &w = *(ThreadWorker *)ctx;
	ThreadQueue &q = w.queue;

	ThreadJob *job;
	while ((job = q.Wait()) != nullptr) {
		job->Run();
		q.Done(*job);
	}

	return nullptr;
}

ThreadWorker::ThreadWorker(ThreadQueue &_queue)
	:queue(_queue)
{
	pthread_attr_t attr;
	pthread_attr_init(&attr);

	/* jobs perform blocking socket I/O and nothing deeply
	   recursive; 256 kB is plenty */
	pthread_attr_setstacksize(&attr, 256 * 1024);

	int error = pthread_create(&thread, &attr, Run, this);
	pthread_attr_destroy(&attr);

	if (error != 0)
		throw MakeErrno(error, "Failed to create worker thread");
}
