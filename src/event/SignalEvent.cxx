// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SignalEvent.hxx"
#include "lib/fmt/RuntimeError.hxx"

void
SignalEvent::Enable()
{
	event.Assign(loop, signo, EV_SIGNAL|EV_PERSIST, EventCallback, this);
	if (!event.Add())
		throw FmtRuntimeError("Failed to register handler for signal {}",
				      signo);
}

void
SignalEvent::EventCallback(evutil_socket_t fd, short, void *ctx) noexcept
{
	auto &event = *(SignalEvent *)ctx;
	event.callback(int(fd));
}
