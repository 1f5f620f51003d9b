// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Notify.hxx"
#include "system/Error.hxx"

#include <stdint.h>

#ifdef __linux__
#include <sys/eventfd.h>
#endif

Notify::Notify(EventLoop &event_loop, Callback _callback)
	:callback(_callback),
	 event(event_loop, BIND_THIS_METHOD(OnEvent))
{
#ifdef __linux__
	read_fd = UniqueFileDescriptor(eventfd(0, EFD_NONBLOCK|EFD_CLOEXEC));
	if (!read_fd.IsDefined())
		throw MakeErrno("eventfd() failed");
#else
	if (!UniqueFileDescriptor::CreatePipe(read_fd, write_fd))
		throw MakeErrno("pipe() failed");

	read_fd.SetNonBlocking();
	write_fd.SetNonBlocking();
#endif

	event.Open(read_fd.Get());
	event.ScheduleRead();
}

Notify::~Notify() noexcept
{
	event.Cancel();
}

void
Notify::Signal() noexcept
{
	if (pending.exchange(true))
		return;

#ifdef __linux__
	static constexpr uint64_t value = 1;
	(void)read_fd.Write(&value, sizeof(value));
#else
	static constexpr char value = 0;
	(void)write_fd.Write(&value, sizeof(value));
#endif
}

inline void
Notify::OnEvent(unsigned) noexcept
{
	char buffer[64];
	(void)read_fd.Read(buffer, sizeof(buffer));

	if (pending.exchange(false))
		callback();
}
