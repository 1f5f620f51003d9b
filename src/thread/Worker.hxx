// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <pthread.h>

class ThreadQueue;

/**
 * A thread that performs queued work.
 */
class ThreadWorker {
	ThreadQueue &queue;

	pthread_t thread;

public:
	/**
	 * Throws on error.
	 */
	explicit ThreadWorker(ThreadQueue &_queue);

	/**
	 * Stops the queue and waits for the thread to exit.
	 */
	~ThreadWorker() noexcept;

	ThreadWorker(const ThreadWorker &) = delete;
	ThreadWorker &operator=(const ThreadWorker &) = delete;

private:
	static void *Run(void *ctx) noexcept;
};
