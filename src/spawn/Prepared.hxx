// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <string>
#include <string_view>
#include <vector>

/**
 * Everything needed to launch a child process: its command line and
 * the file descriptors it gets.  The environment is inherited.
 */
struct PreparedChildProcess {
	std::vector<std::string> args;

	/**
	 * If undefined, /dev/null is used.
	 */
	UniqueFileDescriptor stdout_fd, stderr_fd;

	PreparedChildProcess() noexcept = default;

	PreparedChildProcess(PreparedChildProcess &&) noexcept = default;
	PreparedChildProcess &operator=(PreparedChildProcess &&) noexcept = default;

	void Append(std::string_view arg) noexcept {
		args.emplace_back(arg);
	}

	void Append(std::string_view name, std::string_view value) noexcept {
		Append(name);
		Append(value);
	}

	/**
	 * The program to be executed; this is the first argument.
	 */
	const char *GetExecutable() const noexcept {
		return args.empty() ? nullptr : args.front().c_str();
	}

	/**
	 * Build a null-terminated argv array which points into
	 * #args.  It is valid as long as #args is not modified.
	 */
	std::vector<const char *> MakeArgv() const noexcept;
};
