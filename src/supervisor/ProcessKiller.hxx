// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <set>

#include <sys/types.h>

class CancellablePointer;

using PidSet = std::set<pid_t>;

class ProcessKillerHandler {
public:
	/**
	 * @param killed true if at least one process was signalled
	 */
	virtual void OnProcessKillerDone(bool killed) noexcept = 0;
};

/**
 * Finds and kills processes which occupy a TCP port.  Discovery is
 * best-effort: errors are logged and reported as "nothing killed".
 */
class ProcessKiller {
public:
	virtual ~ProcessKiller() noexcept = default;

	/**
	 * Send SIGKILL to all processes listening on the given port.
	 */
	virtual void KillProcessOnPort(unsigned port,
				       ProcessKillerHandler &handler,
				       CancellablePointer &cancel_ptr) noexcept = 0;

	/**
	 * Send SIGKILL to orphaned sidecar processes for the given
	 * port: processes whose command line matches the launch
	 * signature and whose pid is not in the given set of tracked
	 * processes.  Unrecognized processes are never killed.
	 *
	 * The caller should wait a short grace period before probing
	 * the port again if something was killed.
	 */
	virtual void KillZombieProcessesForPort(unsigned port,
						PidSet &&tracked,
						ProcessKillerHandler &handler,
						CancellablePointer &cancel_ptr) noexcept = 0;
};
