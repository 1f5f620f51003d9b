// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Job.hxx"
#include "Notify.hxx"

#include <boost/intrusive/list.hpp>

#include <condition_variable>
#include <mutex>

/**
 * A queue that manages work for worker threads.  Jobs are added
 * from the main thread; their Done() method is invoked in the main
 * thread after a worker has finished them.
 */
class ThreadQueue {
	using JobList =
		boost::intrusive::list<ThreadJob,
				       boost::intrusive::constant_time_size<false>>;

	std::mutex mutex;
	std::condition_variable cond;

	bool alive = true;

	/**
	 * Jobs which are waiting for a worker thread.
	 */
	JobList waiting;

	/**
	 * Jobs which have been finished; their Done() method will be
	 * invoked in the main thread.
	 */
	JobList done;

	Notify notify;

public:
	explicit ThreadQueue(EventLoop &event_loop);

	/**
	 * Invokes the Done() method of all jobs which are still
	 * queued.  All workers must have been joined.
	 */
	~ThreadQueue() noexcept;

	ThreadQueue(const ThreadQueue &) = delete;
	ThreadQueue &operator=(const ThreadQueue &) = delete;

	/**
	 * Cancel all Wait() calls and refuse all further calls.  This
	 * is used to initiate shutdown of all threads connected to
	 * this queue.
	 */
	void Stop() noexcept;

	/**
	 * Enqueue a job, and wake up an idle thread (if there is
	 * any).
	 */
	void Add(ThreadJob &job) noexcept;

	/**
	 * Dequeue an existing job or wait for a new job, and reserve
	 * it.  Called by the worker thread.
	 *
	 * @return nullptr if Stop() has been called
	 */
	ThreadJob *Wait() noexcept;

	/**
	 * Mark the specified job (returned by Wait()) as "done".
	 * Called by the worker thread.
	 */
	void Done(ThreadJob &job) noexcept;

private:
	void OnNotify() noexcept;
};
