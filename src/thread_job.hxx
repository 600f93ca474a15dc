// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <boost/intrusive/list_hook.hpp>

class ThreadJob
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
public:
	enum class State {
		/**
		 * The job is not in any queue.
		 */
		INITIAL,

		/**
		 * The job has been added to the queue, but is not being
		 * worked on yet.
		 */
		WAITING,

		/**
		 * The job is being performed via Run().
		 */
		BUSY,

		/**
		 * The job has finished, but nobody has collected it with
		 * ThreadQueue::WaitDone() yet.
		 */
		DONE,
	};

	State state = State::INITIAL;

	ThreadJob() = default;
	ThreadJob(const ThreadJob &) = delete;
	ThreadJob &operator=(const ThreadJob &) = delete;

	/**
	 * Is this job currently idle, i.e. not being worked on by a
	 * worker thread?  A "true" return value guarantees that no
	 * worker thread is and will be working on it.
	 */
	bool IsIdle() const noexcept {
		return state == State::INITIAL;
	}

	/**
	 * Invoked in a worker thread.  Exceptions must be caught by the
	 * implementation.
	 */
	virtual void Run() noexcept = 0;

protected:
	~ThreadJob() noexcept = default;
};
