// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Worker.hxx"
#include "Queue.hxx"
#include "system/Error.hxx"
#include "util/ScopeExit.hxx"

ThreadWorker::ThreadWorker(ThreadQueue &_queue)
	:queue(_queue)
{
	pthread_attr_t attr;
	pthread_attr_init(&attr);
	AtScopeExit(&attr) { pthread_attr_destroy(&attr); };

	/* 256 kB stack ought to be enough */
	pthread_attr_setstacksize(&attr, 256 * 1024);

	int error = pthread_create(&thread, &attr, Run, this);
	if (error != 0)
		throw MakeErrno(error, "Failed to create worker thread");
}

ThreadWorker::~ThreadWorker() noexcept
{
	queue.Stop();
	pthread_join(thread, nullptr);
}

void *
ThreadWorker::Run(void *ctx) noexcept
{
	auto &w = *(ThreadWorker *)ctx;
	ThreadQueue &q = w.queue;

	ThreadJob *job;
	while ((job = q.Wait()) != nullptr) {
		job->Run();
		q.Done(*job);
	}

	return nullptr;
}
