// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"
#include "util/BindMethod.hxx"

#include <utility>

/**
 * Monitor a file descriptor for readiness.  The file descriptor is
 * not owned by this class.
 */
class SocketEvent final {
	EventLoop &loop;

	Event event;

	int fd = -1;

	unsigned scheduled_flags = 0;

	using Callback = BoundMethod<void(unsigned events) noexcept>;
	const Callback callback;

public:
	static constexpr unsigned READ = EV_READ;
	static constexpr unsigned WRITE = EV_WRITE;

	SocketEvent(EventLoop &_loop, Callback _callback,
		    int _fd=-1) noexcept
		:loop(_loop), fd(_fd), callback(_callback) {}

	~SocketEvent() noexcept {
		Cancel();
	}

	SocketEvent(const SocketEvent &) = delete;
	SocketEvent &operator=(const SocketEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int GetFd() const noexcept {
		return fd;
	}

	void Open(int _fd) noexcept {
		Cancel();
		fd = _fd;
	}

	/**
	 * Cancel the event and forget the file descriptor without
	 * closing it.
	 */
	int ReleaseFd() noexcept {
		Cancel();
		return std::exchange(fd, -1);
	}

	unsigned GetScheduledFlags() const noexcept {
		return scheduled_flags;
	}

	/**
	 * @return false on error
	 */
	bool Schedule(unsigned flags) noexcept;

	bool ScheduleRead() noexcept {
		return Schedule(GetScheduledFlags() | READ);
	}

	void Cancel() noexcept {
		if (scheduled_flags != 0) {
			scheduled_flags = 0;
			event.Delete();
		}
	}

private:
	static void EventCallback(evutil_socket_t fd, short events,
				  void *ctx) noexcept;
};
