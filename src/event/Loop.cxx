// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"

#include <event2/event.h>

#include <stdexcept>

static struct event_base *
CreateEventBase()
{
	struct event_base *base = ::event_base_new();
	if (base == nullptr)
		throw std::runtime_error("event_base_new() failed");

	return base;
}

EventLoop::EventLoop()
	:event_base(CreateEventBase())
{
}

EventLoop::~EventLoop() noexcept
{
	defer.clear();

	::event_base_free(event_base);
}

void
EventLoop::Run() noexcept
{
	quit = false;

	RunDeferred();

	while (!quit) {
		const bool more = ::event_base_loop(event_base, EVLOOP_ONCE) == 0;
		RunDeferred();

		if (!more && defer.empty())
			/* no more events */
			break;
	}
}

bool
EventLoop::LoopOnceNonBlock() noexcept
{
	quit = false;

	RunDeferred();
	const bool result = ::event_base_loop(event_base,
					      EVLOOP_ONCE|EVLOOP_NONBLOCK) == 0;
	RunDeferred();
	return result;
}

void
EventLoop::Break() noexcept
{
	quit = true;
	::event_base_loopbreak(event_base);
}

void
EventLoop::AddDefer(DeferEvent &e) noexcept
{
	defer.push_back(e);
}

void
EventLoop::RemoveDefer(DeferEvent &e) noexcept
{
	defer.erase(defer.iterator_to(e));
}

void
EventLoop::RunDeferred() noexcept
{
	while (!defer.empty() && !quit)
		defer.pop_front_and_dispose([](DeferEvent *e){
			e->Run();
		});
}
