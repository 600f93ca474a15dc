// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Event.hxx"

#include <stdexcept>

Event::Event(EventLoop &loop, evutil_socket_t fd, short mask,
	     event_callback_fn callback, void *ctx)
	:event(::event_new(loop.Get(), fd, mask, callback, ctx))
{
	if (event == nullptr)
		throw std::runtime_error("event_new() failed");
}
