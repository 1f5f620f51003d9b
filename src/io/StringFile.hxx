// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

class FileDescriptor;

/**
 * Read everything from the file descriptor until end-of-file.
 * Throws on error.
 */
std::string
ReadToString(FileDescriptor fd);

/**
 * Load the contents of a file into a std::string.  Throws on error.
 */
std::string
LoadStringFile(const char *path);
