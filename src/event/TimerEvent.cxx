// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimerEvent.hxx"

TimerEvent::TimerEvent(EventLoop &_loop, Callback _callback) noexcept
	:loop(_loop), callback(_callback)
{
	event.Assign(loop, -1, 0, EventCallback, this);
}

void
TimerEvent::EventCallback(evutil_socket_t, short, void *ctx) noexcept
{
	auto &timer = *(TimerEvent *)ctx;
	timer.callback();
}
