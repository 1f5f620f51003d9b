// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketEvent.hxx"

#include <cassert>

bool
SocketEvent::Schedule(unsigned flags) noexcept
{
	assert(IsDefined());

	if (flags == scheduled_flags)
		return true;

	Cancel();

	if (flags == 0)
		return true;

	event.Assign(loop, fd, short(flags|EV_PERSIST), EventCallback, this);
	if (!event.Add())
		return false;

	scheduled_flags = flags;
	return true;
}

void
SocketEvent::EventCallback(evutil_socket_t, short events, void *ctx) noexcept
{
	auto &event = *(SocketEvent *)ctx;
	event.callback(unsigned(events) & (READ|WRITE));
}
