// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Event.hxx"

#include <signal.h>

/**
 * Invoke a method of class T when one of the shutdown signals
 * (SIGTERM, SIGINT, SIGQUIT) is received.
 */
template<class T, void (T::*method)() noexcept>
class ShutdownListener {
	T &instance;

	Event sigterm, sigint, sigquit;

public:
	ShutdownListener(EventLoop &loop, T &_instance)
		:instance(_instance),
		 sigterm(loop, SIGTERM, EV_SIGNAL|EV_PERSIST, Callback, this),
		 sigint(loop, SIGINT, EV_SIGNAL|EV_PERSIST, Callback, this),
		 sigquit(loop, SIGQUIT, EV_SIGNAL|EV_PERSIST, Callback, this) {}

	~ShutdownListener() noexcept {
		Disable();
	}

	ShutdownListener(const ShutdownListener &) = delete;
	ShutdownListener &operator=(const ShutdownListener &) = delete;

	void Enable() noexcept {
		sigterm.Add();
		sigint.Add();
		sigquit.Add();
	}

	void Disable() noexcept {
		sigterm.Delete();
		sigint.Delete();
		sigquit.Delete();
	}

private:
	static void Callback(evutil_socket_t, short, void *ctx) noexcept {
		auto &listener = *(ShutdownListener *)ctx;
		listener.Disable();
		(listener.instance.*method)();
	}
};
