// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/intrusive/list_hook.hpp>

/**
 * A job that shall be executed in a worker thread.
 */
class ThreadJob
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::safe_link>> {
	friend class ThreadQueue;

	enum class State {
		/**
		 * The job is not in any queue.
		 */
		INITIAL,

		/**
		 * The job has been added to the queue, but is not being
		 * worked on yet.
		 */
		WAITING,

		/**
		 * The job is being performed via Run().
		 */
		BUSY,

		/**
		 * The job has finished, but the Done() method has not
		 * been invoked yet.
		 */
		DONE,
	};

	State state = State::INITIAL;

public:
	virtual ~ThreadJob() noexcept = default;

	/**
	 * Is this job currently idle, i.e. not being worked on by a
	 * worker thread?  This method may be called only from the
	 * main thread.
	 */
	bool IsIdle() const noexcept {
		return state == State::INITIAL;
	}

	/**
	 * Perform the work.  Called in a worker thread.
	 */
	virtual void Run() noexcept = 0;

	/**
	 * Called in the main thread after Run() has finished.
	 */
	virtual void Done() noexcept = 0;
};
