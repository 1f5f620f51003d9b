// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AsyncMutex.hxx"

#include <cassert>

void
AsyncMutex::Lock(AsyncMutexWaiter &w) noexcept
{
	assert(!w.IsWaiting());

	waiters.push_back(w);

	if (!locked)
		grant_event.Schedule();
}

void
AsyncMutex::Unlock() noexcept
{
	assert(locked);

	locked = false;

	if (!waiters.empty())
		grant_event.Schedule();
}

void
AsyncMutex::OnGrant() noexcept
{
	if (locked || waiters.empty())
		return;

	auto &w = waiters.front();
	waiters.pop_front();

	locked = true;
	w.callback();
}
