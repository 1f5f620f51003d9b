// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

struct event_base;

/**
 * Wrapper for a struct event_base.  In addition to the libevent
 * events, it manages a list of #DeferEvent instances which are
 * invoked between two libevent iterations.
 */
class EventLoop {
	struct event_base *const event_base;

	boost::intrusive::list<DeferEvent,
			       boost::intrusive::member_hook<DeferEvent,
							     DeferEvent::SiblingsHook,
							     &DeferEvent::siblings>,
			       boost::intrusive::constant_time_size<false>> defer;

	bool quit = false;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();

	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() const noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called or until there are
	 * no more registered events.
	 */
	void Run() noexcept;

	/**
	 * Run one iteration without blocking.
	 *
	 * @return false if there are no more registered events
	 */
	bool LoopOnceNonBlock() noexcept;

	/**
	 * Stop the Run() loop after the current iteration.
	 */
	void Break() noexcept;

	void AddDefer(DeferEvent &e) noexcept;
	void RemoveDefer(DeferEvent &e) noexcept;

private:
	void RunDeferred() noexcept;
};
