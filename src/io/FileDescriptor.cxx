// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileDescriptor.hxx"

#include <fcntl.h>

#ifndef O_CLOEXEC
#define O_CLOEXEC 0
#endif

bool
FileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	fd = ::open(pathname, O_RDONLY|O_NOCTTY|O_CLOEXEC);
	return IsDefined();
}

bool
FileDescriptor::CreatePipe(FileDescriptor &r, FileDescriptor &w) noexcept
{
	int fds[2];
	if (::pipe(fds) < 0)
		return false;

	r = FileDescriptor(fds[0]);
	w = FileDescriptor(fds[1]);
	r.EnableCloseOnExec();
	w.EnableCloseOnExec();
	return true;
}

void
FileDescriptor::SetNonBlocking() const noexcept
{
	int flags = fcntl(fd, F_GETFL);
	fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void
FileDescriptor::SetBlocking() const noexcept
{
	int flags = fcntl(fd, F_GETFL);
	fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
}

void
FileDescriptor::EnableCloseOnExec() const noexcept
{
	const int old_flags = fcntl(fd, F_GETFD, 0);
	fcntl(fd, F_SETFD, old_flags | FD_CLOEXEC);
}

void
FileDescriptor::DisableCloseOnExec() const noexcept
{
	const int old_flags = fcntl(fd, F_GETFD, 0);
	fcntl(fd, F_SETFD, old_flags & ~FD_CLOEXEC);
}

bool
FileDescriptor::CheckDuplicate(FileDescriptor new_fd) const noexcept
{
	if (*this == new_fd) {
		DisableCloseOnExec();
		return true;
	}

	return ::dup2(Get(), new_fd.Get()) >= 0;
}
