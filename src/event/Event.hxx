// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Chrono.hxx"

#include <event2/event.h>
#include <event2/event_struct.h>

class EventLoop;

/**
 * Wrapper for a struct event.
 */
class Event {
	struct event event;

	bool assigned = false;

public:
	using Clock = EventChrono::Clock;
	using Duration = EventChrono::Duration;

	Event() noexcept = default;

	~Event() noexcept {
		Delete();
	}

	Event(const Event &other) = delete;
	Event &operator=(const Event &other) = delete;

	bool IsAssigned() const noexcept {
		return assigned;
	}

	void Assign(EventLoop &loop, evutil_socket_t fd, short mask,
		    event_callback_fn callback, void *ctx) noexcept;

	bool Add(const struct timeval *timeout=nullptr) noexcept {
		return ::event_add(&event, timeout) == 0;
	}

	bool Add(Duration d) noexcept {
		const auto tv = EventChrono::ToTimeval(d);
		return Add(&tv);
	}

	void Delete() noexcept {
		if (assigned)
			::event_del(&event);
	}

	[[gnu::pure]]
	bool IsPending(short events) const noexcept {
		return assigned && ::event_pending(&event, events, nullptr);
	}
};
