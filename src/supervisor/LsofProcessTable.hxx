// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ProcessTable.hxx"

/**
 * A #ProcessTable implementation for systems without a /proc file
 * system: it runs "lsof" and "ps", each bounded by a timeout.
 */
class LsofProcessTable final : public ProcessTable {
	const std::chrono::milliseconds timeout;

public:
	explicit LsofProcessTable(std::chrono::milliseconds _timeout) noexcept
		:timeout(_timeout) {}

	/* virtual methods from class ProcessTable */
	std::vector<pid_t> FindListeners(unsigned port) const override;
	std::vector<ProcessInfo> ListProcesses() const override;
};
