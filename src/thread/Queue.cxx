// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Queue.hxx"

#include <cassert>

ThreadQueue::ThreadQueue(EventLoop &event_loop)
	:notify(event_loop, BIND_THIS_METHOD(OnNotify))
{
}

ThreadQueue::~ThreadQueue() noexcept
{
	assert(!alive);

	JobList pending;

	{
		const std::scoped_lock lock{mutex};
		pending.splice(pending.end(), waiting);
		pending.splice(pending.end(), done);
	}

	pending.clear_and_dispose([](ThreadJob *job){
		job->state = ThreadJob::State::INITIAL;
		job->Done();
	});
}

void
ThreadQueue::Stop() noexcept
{
	const std::scoped_lock lock{mutex};
	alive = false;
	cond.notify_all();
}

void
ThreadQueue::Add(ThreadJob &job) noexcept
{
	const std::scoped_lock lock{mutex};

	assert(job.state == ThreadJob::State::INITIAL);

	job.state = ThreadJob::State::WAITING;
	waiting.push_back(job);
	cond.notify_one();
}

ThreadJob *
ThreadQueue::Wait() noexcept
{
	std::unique_lock lock{mutex};

	cond.wait(lock, [this]{ return !alive || !waiting.empty(); });

	if (!alive)
		return nullptr;

	auto &job = waiting.front();
	waiting.pop_front();

	assert(job.state == ThreadJob::State::WAITING);
	job.state = ThreadJob::State::BUSY;
	return &job;
}

void
ThreadQueue::Done(ThreadJob &job) noexcept
{
	{
		const std::scoped_lock lock{mutex};

		assert(job.state == ThreadJob::State::BUSY);

		job.state = ThreadJob::State::DONE;
		done.push_back(job);
	}

	notify.Signal();
}

inline void
ThreadQueue::OnNotify() noexcept
{
	JobList finished;

	{
		const std::scoped_lock lock{mutex};
		finished.splice(finished.end(), done);
	}

	finished.clear_and_dispose([](ThreadJob *job){
		job->state = ThreadJob::State::INITIAL;

		/* this may destroy the job */
		job->Done();
	});
}
