// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>
#include <vector>

struct CommandResult {
	/**
	 * The raw status as returned by waitpid().
	 */
	int status;

	std::string output;

	bool IsSuccess() const noexcept;
};

/**
 * Run a command synchronously and collect its standard output.
 * Standard error is discarded.  This blocks the calling thread; it
 * is meant to be called in a worker thread.
 *
 * Throws on error, or if the command does not finish within the
 * given timeout (in which case it is killed).
 */
CommandResult
RunCommand(std::vector<std::string> &&args,
	   std::chrono::milliseconds timeout);
