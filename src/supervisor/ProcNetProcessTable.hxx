// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ProcessTable.hxx"

/**
 * A #ProcessTable implementation which reads the Linux /proc file
 * system: the socket tables in /proc/net/tcp{,6} are joined with
 * the file descriptor links in /proc/PID/fd.
 */
class ProcNetProcessTable final : public ProcessTable {
public:
	/* virtual methods from class ProcessTable */
	std::vector<pid_t> FindListeners(unsigned port) const override;
	std::vector<ProcessInfo> ListProcesses() const override;
};
