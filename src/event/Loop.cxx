// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Loop.hxx"

#include <event2/thread.h>

#include <mutex>
#include <stdexcept>

static struct event_base *
CreateEventBase()
{
	/* the tend thread's loop is woken from application threads,
	   so libevent's locking must be enabled before the first
	   event_base is created */
	static std::once_flag threads_enabled;
	std::call_once(threads_enabled, [](){
		if (evthread_use_pthreads() != 0)
			throw std::runtime_error("evthread_use_pthreads() failed");
	});

	struct event_base *base = event_base_new();
	if (base == nullptr)
		throw std::runtime_error("event_base_new() failed");

	return base;
}

EventLoop::EventLoop()
	:event_base(CreateEventBase())
{
}

EventLoop::~EventLoop() noexcept
{
	::event_base_free(event_base);
}
