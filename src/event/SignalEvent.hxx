// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"
#include "util/BindMethod.hxx"

/**
 * Listen for a signal through the #EventLoop.  The callback is
 * invoked from within the loop, not from the signal handler.
 */
class SignalEvent final {
	EventLoop &loop;

	Event event;

	const int signo;

	using Callback = BoundMethod<void(int signo) noexcept>;
	const Callback callback;

public:
	SignalEvent(EventLoop &_loop, int _signo, Callback _callback) noexcept
		:loop(_loop), signo(_signo), callback(_callback) {}

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	/**
	 * Throws on error.
	 */
	void Enable();

	void Disable() noexcept {
		event.Delete();
	}

private:
	static void EventCallback(evutil_socket_t fd, short events,
				  void *ctx) noexcept;
};
