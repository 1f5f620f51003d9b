// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Operation.hxx"
#include "Handler.hxx"
#include "AsyncMutex.hxx"
#include "io/Logger.hxx"

#include <exception>
#include <list>
#include <memory>
#include <string>
#include <string_view>

class Supervisor;
struct ProcessEntry;

/**
 * Stops the sidecar of one tenant under the tenant's lock.  The
 * registry entry (and with it the ownership of port and pid) is
 * removed before the process is signalled, so it is released even if
 * the process cannot be terminated.
 */
class StopOperation final : public SupervisorOperation {
	Supervisor &supervisor;

	const ChildLogger logger;

	const std::string tenant;

	AsyncMutex &lock;
	AsyncMutexWaiter lock_waiter;
	bool locked = false;

	std::unique_ptr<ProcessEntry> entry;

	SidecarStopHandler &handler;

public:
	StopOperation(Supervisor &_supervisor, std::string_view _tenant,
		      SidecarStopHandler &_handler,
		      CancellablePointer &cancel_ptr) noexcept;

	~StopOperation() noexcept override;

	void Start() noexcept;

private:
	void Release() noexcept;
	void Finish() noexcept;

	void OnLocked() noexcept;
	void OnTerminated() noexcept;

	/* virtual methods from class Cancellable */
	void Cancel() noexcept override;
};

/**
 * Runs a #StopOperation for each tenant and completes after all of
 * them have completed.
 */
class StopAllOperation final : public SupervisorOperation {
	class Child final : public SidecarStopHandler {
		StopAllOperation &parent;

	public:
		CancellablePointer cancel_ptr;

		bool done = false;

		explicit Child(StopAllOperation &_parent) noexcept
			:parent(_parent) {}

		/* virtual methods from class SidecarStopHandler */
		void OnSidecarStopped() noexcept override;
		void OnSidecarStopError(std::exception_ptr error) noexcept override;
	};

	Supervisor &supervisor;

	std::list<Child> children;

	std::size_t n_pending = 0;

	SidecarStopHandler &handler;

public:
	StopAllOperation(Supervisor &_supervisor,
			 SidecarStopHandler &_handler,
			 CancellablePointer &cancel_ptr) noexcept;

	void Start() noexcept;

private:
	void OnChildDone() noexcept;
	void OnChildError(std::exception_ptr error) noexcept;

	/* virtual methods from class Cancellable */
	void Cancel() noexcept override;
};
