// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ProcessKiller.hxx"
#include "io/Logger.hxx"

#include <memory>
#include <string>
#include <string_view>

class ThreadQueue;
class ProcessTable;

/**
 * The #ProcessKiller implementation which uses a #ProcessTable for
 * discovery.  The blocking work is done in a worker thread; the
 * handler is invoked in the main thread.
 */
class PortProcessKiller final : public ProcessKiller {
	class Job;

	ThreadQueue &queue;

	const std::shared_ptr<const ProcessTable> table;

	/**
	 * See SupervisorConfig::GetSignature().
	 */
	const std::string signature;

	const Logger logger;

public:
	PortProcessKiller(ThreadQueue &_queue,
			  std::shared_ptr<const ProcessTable> _table,
			  std::string_view _signature) noexcept;

	~PortProcessKiller() noexcept override;

	/* virtual methods from class ProcessKiller */
	void KillProcessOnPort(unsigned port,
			       ProcessKillerHandler &handler,
			       CancellablePointer &cancel_ptr) noexcept override;
	void KillZombieProcessesForPort(unsigned port,
					PidSet &&tracked,
					ProcessKillerHandler &handler,
					CancellablePointer &cancel_ptr) noexcept override;
};
