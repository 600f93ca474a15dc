// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Event.hxx"

/**
 * Invoke a method of class T when the timer expires or when the
 * event is activated manually.
 */
template<class T, void (T::*method)() noexcept>
class TimerEvent {
	T &instance;

	Event event;

public:
	TimerEvent(EventLoop &loop, T &_instance)
		:instance(_instance),
		 event(loop, -1, 0, Callback, this) {}

	bool IsPending() const noexcept {
		return event.IsTimerPending();
	}

	void Schedule(std::chrono::steady_clock::duration d) noexcept {
		event.Add(d);
	}

	/**
	 * Run the callback as soon as possible.  May be called from any
	 * thread.
	 */
	void Trigger() noexcept {
		event.Activate();
	}

	void Cancel() noexcept {
		event.Delete();
	}

private:
	static void Callback(evutil_socket_t, short, void *ctx) noexcept {
		auto &timer = *(TimerEvent *)ctx;
		(timer.instance.*method)();
	}
};
