// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringFile.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

std::string
ReadToString(FileDescriptor fd)
{
	std::string result;

	char buffer[4096];
	while (true) {
		ssize_t nbytes = fd.Read(buffer, sizeof(buffer));
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to read");
		}

		if (nbytes == 0)
			break;

		result.append(buffer, nbytes);
	}

	return result;
}

std::string
LoadStringFile(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw FmtErrno("Failed to open {}", path);

	return ReadToString(fd);
}
