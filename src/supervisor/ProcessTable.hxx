// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

struct ProcessInfo {
	pid_t pid;

	/**
	 * The command line; arguments are separated by spaces.
	 */
	std::string command;
};

/**
 * Platform specific process discovery.  All methods block; they are
 * meant to be called in a worker thread.
 */
class ProcessTable {
public:
	virtual ~ProcessTable() noexcept = default;

	/**
	 * Find all processes which have a TCP socket listening on the
	 * given port.
	 *
	 * Throws on error.
	 */
	virtual std::vector<pid_t> FindListeners(unsigned port) const = 0;

	/**
	 * List all processes with their command lines.
	 *
	 * Throws on error.
	 */
	virtual std::vector<ProcessInfo> ListProcesses() const = 0;
};

/**
 * Create the #ProcessTable implementation for this operating
 * system: the /proc file system on Linux, "lsof" and "ps" elsewhere.
 *
 * @param command_timeout the time limit for external commands
 */
std::unique_ptr<ProcessTable>
CreateProcessTable(std::chrono::milliseconds command_timeout);

/**
 * Parse the contents of /proc/net/tcp or /proc/net/tcp6 and return
 * the inode numbers of all sockets listening on the given port.
 */
std::vector<unsigned long>
ParseProcNetTcp(std::string_view contents, unsigned port) noexcept;

/**
 * Parse the target of a /proc/PID/fd/N symlink ("socket:[INODE]").
 */
[[gnu::pure]]
std::optional<unsigned long>
ParseSocketLink(std::string_view link) noexcept;

/**
 * Parse the output of "lsof -t" (one process id per line).
 */
std::vector<pid_t>
ParseLsofOutput(std::string_view output) noexcept;

/**
 * Parse the output of "ps -o pid=,command=".
 */
std::vector<ProcessInfo>
ParsePsOutput(std::string_view output) noexcept;

/**
 * Does the command line belong to a sidecar launched for the given
 * port?  It must contain the signature and the option "--port PORT"
 * (or "--port=PORT").
 */
[[gnu::pure]]
bool
MatchesLaunchSignature(std::string_view command,
		       std::string_view signature,
		       unsigned port) noexcept;
