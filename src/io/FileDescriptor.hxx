// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool operator==(FileDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	void Set(int _fd) noexcept {
		fd = _fd;
	}

	int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	void SetUndefined() noexcept {
		fd = -1;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	/**
	 * Open a file in read-only mode.
	 */
	bool OpenReadOnly(const char *pathname) noexcept;

	/**
	 * Create a pipe; both ends are created with O_CLOEXEC.
	 */
	static bool CreatePipe(FileDescriptor &r, FileDescriptor &w) noexcept;

	void SetNonBlocking() const noexcept;
	void SetBlocking() const noexcept;
	void EnableCloseOnExec() const noexcept;
	void DisableCloseOnExec() const noexcept;

	/**
	 * Duplicate the file descriptor onto the specified one.  If
	 * both are equal, only the close-on-exec flag is cleared.
	 */
	bool CheckDuplicate(FileDescriptor new_fd) const noexcept;

	bool Close() noexcept {
		return ::close(std::exchange(fd, -1)) == 0;
	}

	ssize_t Read(void *buffer, std::size_t length) const noexcept {
		return ::read(fd, buffer, length);
	}

	ssize_t Write(const void *buffer, std::size_t length) const noexcept {
		return ::write(fd, buffer, length);
	}
};
