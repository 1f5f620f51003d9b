// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FlushEventLoop.hxx"
#include "supervisor/AsyncMutex.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <vector>

struct RecordingWaiter {
	std::vector<int> &log;
	const int id;

	AsyncMutexWaiter waiter{BIND_THIS_METHOD(OnLocked)};

	RecordingWaiter(std::vector<int> &_log, int _id) noexcept
		:log(_log), id(_id) {}

	void OnLocked() noexcept {
		log.push_back(id);
	}
};

TEST(AsyncMutex, Fifo)
{
	EventLoop event_loop;
	AsyncMutex mutex{event_loop};
	EXPECT_TRUE(mutex.IsIdle());

	std::vector<int> log;
	RecordingWaiter a{log, 1}, b{log, 2}, c{log, 3};

	mutex.Lock(a.waiter);
	mutex.Lock(b.waiter);
	mutex.Lock(c.waiter);

	/* never granted synchronously */
	EXPECT_TRUE(log.empty());
	EXPECT_FALSE(mutex.IsLocked());

	FlushPending(event_loop);
	EXPECT_EQ(log, std::vector<int>({1}));
	EXPECT_TRUE(mutex.IsLocked());
	EXPECT_FALSE(mutex.IsIdle());

	mutex.Unlock();
	FlushPending(event_loop);
	EXPECT_EQ(log, std::vector<int>({1, 2}));

	mutex.Unlock();
	FlushPending(event_loop);
	EXPECT_EQ(log, std::vector<int>({1, 2, 3}));

	mutex.Unlock();
	EXPECT_TRUE(mutex.IsIdle());
}

TEST(AsyncMutex, CancelWaiter)
{
	EventLoop event_loop;
	AsyncMutex mutex{event_loop};

	std::vector<int> log;
	RecordingWaiter a{log, 1}, b{log, 2};

	{
		RecordingWaiter c{log, 3};

		mutex.Lock(a.waiter);
		mutex.Lock(c.waiter);
		mutex.Lock(b.waiter);

		FlushPending(event_loop);
		EXPECT_EQ(log, std::vector<int>({1}));

		/* c is destroyed while waiting */
	}

	mutex.Unlock();
	FlushPending(event_loop);
	EXPECT_EQ(log, std::vector<int>({1, 2}));

	b.waiter.Cancel();
	mutex.Unlock();
	EXPECT_TRUE(mutex.IsIdle());
}
