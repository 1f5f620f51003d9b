// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor which closes it
 * automatically.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&other) noexcept {
		using std::swap;
		swap(fd, other.fd);
		return *this;
	}

	FileDescriptor Release() noexcept {
		return FileDescriptor(Steal());
	}

	static bool CreatePipe(UniqueFileDescriptor &r,
			       UniqueFileDescriptor &w) noexcept {
		FileDescriptor r2, w2;
		if (!FileDescriptor::CreatePipe(r2, w2))
			return false;

		r = UniqueFileDescriptor(r2);
		w = UniqueFileDescriptor(w2);
		return true;
	}
};
