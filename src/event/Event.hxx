// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Loop.hxx"

#include <chrono>

#include <sys/time.h>

/**
 * Wrapper for a struct event.
 */
class Event {
	struct event *const event;

public:
	Event(EventLoop &loop, evutil_socket_t fd, short mask,
	      event_callback_fn callback, void *ctx);

	~Event() noexcept {
		::event_free(event);
	}

	Event(const Event &other) = delete;
	Event &operator=(const Event &other) = delete;

	bool Add(const struct timeval *timeout=nullptr) noexcept {
		return ::event_add(event, timeout) == 0;
	}

	bool Add(const struct timeval &timeout) noexcept {
		return Add(&timeout);
	}

	bool Add(std::chrono::steady_clock::duration d) noexcept {
		const auto us = std::chrono::duration_cast<std::chrono::microseconds>(d);
		const struct timeval tv{
			.tv_sec = time_t(us.count() / 1000000),
			.tv_usec = suseconds_t(us.count() % 1000000),
		};
		return Add(tv);
	}

	void Delete() noexcept {
		::event_del(event);
	}

	/**
	 * Make the event active as if it had been triggered.  Thread
	 * safe.
	 */
	void Activate(short events=EV_TIMEOUT) noexcept {
		::event_active(event, events, 0);
	}

	[[gnu::pure]]
	bool IsPending(short events) const noexcept {
		return ::event_pending(event, events, nullptr);
	}

	[[gnu::pure]]
	bool IsTimerPending() const noexcept {
		return IsPending(EV_TIMEOUT);
	}
};
