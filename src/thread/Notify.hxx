// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/SocketEvent.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/BindMethod.hxx"

#include <atomic>

/**
 * Send notifications from a worker thread to the main thread.
 */
class Notify {
	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

	/**
	 * On Linux, this is an eventfd and #write_fd is undefined.
	 * Elsewhere, this is the read side of a pipe.
	 */
	UniqueFileDescriptor read_fd;
	UniqueFileDescriptor write_fd;

	SocketEvent event;

	std::atomic_bool pending{false};

public:
	/**
	 * Throws on error.
	 */
	Notify(EventLoop &event_loop, Callback _callback);
	~Notify() noexcept;

	Notify(const Notify &) = delete;
	Notify &operator=(const Notify &) = delete;

	void Enable() noexcept {
		event.ScheduleRead();
	}

	void Disable() noexcept {
		event.Cancel();
	}

	/**
	 * Wake up the main thread.  This method may be called from
	 * any thread.
	 */
	void Signal() noexcept;

private:
	void OnEvent(unsigned events) noexcept;
};
