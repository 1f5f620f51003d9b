// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"
#include "util/BindMethod.hxx"

/**
 * Invoke an event callback after a certain amount of time.
 */
class TimerEvent final {
	EventLoop &loop;

	Event event;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	using Duration = Event::Duration;

	TimerEvent(EventLoop &_loop, Callback _callback) noexcept;

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	bool IsPending() const noexcept {
		return event.IsPending(EV_TIMEOUT);
	}

	/**
	 * Schedule the timer, replacing a previously scheduled
	 * timeout.
	 */
	void Schedule(Duration d) noexcept {
		event.Add(d);
	}

	void Cancel() noexcept {
		event.Delete();
	}

private:
	static void EventCallback(evutil_socket_t fd, short events,
				  void *ctx) noexcept;
};
