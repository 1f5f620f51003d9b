// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Event.hxx"
#include "Loop.hxx"

void
Event::Assign(EventLoop &loop, evutil_socket_t fd, short mask,
	      event_callback_fn callback, void *ctx) noexcept
{
	Delete();

	::event_assign(&event, loop.Get(), fd, mask, callback, ctx);
	assigned = true;
}
