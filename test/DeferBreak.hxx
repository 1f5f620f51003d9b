// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/DeferEvent.hxx"
#include "event/Loop.hxx"

/**
 * Breaks the event loop after all pending deferred calls have been
 * invoked.
 */
class DeferBreak {
	DeferEvent event;

public:
	explicit DeferBreak(EventLoop &event_loop) noexcept
		:event(event_loop, BIND_THIS_METHOD(Break)) {}

	void Schedule() noexcept {
		event.Schedule();
	}

private:
	void Break() noexcept {
		event.GetEventLoop().Break();
	}
};
