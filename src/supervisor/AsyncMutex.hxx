// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/DeferEvent.hxx"
#include "util/BindMethod.hxx"

#include <boost/intrusive/list.hpp>

class AsyncMutex;

/**
 * A request to lock an #AsyncMutex.  Destroying it while it is
 * waiting withdraws the request.
 */
class AsyncMutexWaiter final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>> {
	friend class AsyncMutex;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	explicit AsyncMutexWaiter(Callback _callback) noexcept
		:callback(_callback) {}

	AsyncMutexWaiter(const AsyncMutexWaiter &) = delete;
	AsyncMutexWaiter &operator=(const AsyncMutexWaiter &) = delete;

	bool IsWaiting() const noexcept {
		return is_linked();
	}

	/**
	 * Withdraw the request.  No-op if it is not waiting.
	 */
	void Cancel() noexcept {
		if (is_linked())
			unlink();
	}
};

/**
 * A mutex for operations running in the event loop.  Waiters are
 * granted the lock in FIFO order; the grant is delivered from a
 * #DeferEvent, never from within Lock() or Unlock().
 */
class AsyncMutex {
	boost::intrusive::list<AsyncMutexWaiter,
			       boost::intrusive::constant_time_size<false>> waiters;

	DeferEvent grant_event;

	bool locked = false;

public:
	explicit AsyncMutex(EventLoop &event_loop) noexcept
		:grant_event(event_loop, BIND_THIS_METHOD(OnGrant)) {}

	~AsyncMutex() noexcept {
		waiters.clear();
	}

	AsyncMutex(const AsyncMutex &) = delete;
	AsyncMutex &operator=(const AsyncMutex &) = delete;

	bool IsLocked() const noexcept {
		return locked;
	}

	/**
	 * Is this mutex unlocked and nobody is waiting for it?
	 */
	bool IsIdle() const noexcept {
		return !locked && waiters.empty();
	}

	/**
	 * Enqueue a request.  The waiter's callback is invoked as
	 * soon as the lock has been granted to it; the callee owns
	 * the lock then and must call Unlock() eventually.
	 */
	void Lock(AsyncMutexWaiter &w) noexcept;

	void Unlock() noexcept;

private:
	void OnGrant() noexcept;
};
