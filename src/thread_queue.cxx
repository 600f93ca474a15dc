// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "thread_queue.hxx"

#include <cassert>

ThreadQueue::~ThreadQueue() noexcept
{
	assert(!alive);
	assert(waiting.empty());
	assert(busy.empty());
}

void
ThreadQueue::Stop() noexcept
{
	const std::scoped_lock lock{mutex};
	alive = false;

	waiting.clear_and_dispose([](ThreadJob *job){
		job->state = ThreadJob::State::DONE;
	});

	cond.notify_all();
	done_cond.notify_all();
}

void
ThreadQueue::Add(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};
	assert(job.state == ThreadJob::State::INITIAL);

	if (!alive) {
		/* nobody will ever run it */
		job.state = ThreadJob::State::DONE;
		done_cond.notify_all();
		return;
	}

	job.state = ThreadJob::State::WAITING;
	waiting.push_back(job);
	cond.notify_one();
}

ThreadJob *
ThreadQueue::Wait() noexcept
{
	std::unique_lock lock{mutex};

	while (true) {
		if (!alive)
			return nullptr;

		auto i = waiting.begin();
		if (i != waiting.end()) {
			auto &job = *i;
			assert(job.state == ThreadJob::State::WAITING);

			job.state = ThreadJob::State::BUSY;
			waiting.erase(i);
			busy.push_back(job);
			return &job;
		}

		/* queue is empty, wait for a new job to be added */
		cond.wait(lock);
	}
}

void
ThreadQueue::Done(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};
	assert(job.state == ThreadJob::State::BUSY);

	job.state = ThreadJob::State::DONE;
	busy.erase(busy.iterator_to(job));
	done_cond.notify_all();
}

void
ThreadQueue::WaitDone(ThreadJob &job) noexcept
{
	std::unique_lock lock{mutex};
	done_cond.wait(lock, [&job]{
		return job.state == ThreadJob::State::DONE ||
			job.state == ThreadJob::State::INITIAL;
	});

	job.state = ThreadJob::State::INITIAL;
}

bool
ThreadQueue::Cancel(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};

	switch (job.state) {
	case ThreadJob::State::INITIAL:
		/* already idle */
		return true;

	case ThreadJob::State::WAITING:
		waiting.erase(waiting.iterator_to(job));
		job.state = ThreadJob::State::INITIAL;
		return true;

	case ThreadJob::State::BUSY:
	case ThreadJob::State::DONE:
		/* no chance */
		return false;
	}

	return false;
}
