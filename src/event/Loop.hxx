// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <event2/event.h>

/**
 * Wrapper for a libevent event_base.  Break() may be called from
 * any thread; everything else belongs to the thread which runs
 * Dispatch().
 */
class EventLoop {
	struct event_base *const event_base;

public:
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called or no more events are
	 * registered.
	 */
	void Dispatch() noexcept {
		::event_base_loop(event_base, EVLOOP_NO_EXIT_ON_EMPTY);
	}

	bool LoopOnce() noexcept {
		return ::event_base_loop(event_base, EVLOOP_ONCE) == 0;
	}

	void Break() noexcept {
		::event_base_loopbreak(event_base);
	}
};
