// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Operation.hxx"
#include "Supervisor.hxx"
#include "AuthConfig.hxx"
#include "CommandLine.hxx"
#include "ProcessKiller.hxx"
#include "StartupMonitor.hxx"
#include "Handler.hxx"
#include "AsyncMutex.hxx"
#include "event/TimerEvent.hxx"
#include "io/Logger.hxx"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class SidecarProcess;
struct ProcessEntry;

/**
 * Starts the sidecar of one tenant.  Under the tenant's lock, it
 * reuses or replaces an existing sidecar, sweeps orphaned processes,
 * makes sure the port is available and launches the process, retrying
 * startup failures.  Configuration errors and port conflicts are not
 * retried.
 *
 * Ownership of the port and the pid is claimed only after the
 * process has bound the port.  Until then, the port is reserved in
 * the #TenantRegistry so other tenants are refused.
 */
class StartOperation final
	: public SupervisorOperation,
	  StartupMonitorHandler, ProcessKillerHandler, PortArbitrationHandler {

	Supervisor &supervisor;

	const ChildLogger logger;

	const std::string tenant;

	SidecarEndpoint endpoint;

	AuthConfig auth;

	const StartOptions options;

	AsyncMutex &lock;
	AsyncMutexWaiter lock_waiter;
	bool locked = false;

	/**
	 * The previous sidecar of this tenant which is being
	 * terminated because its configuration has changed.
	 */
	std::unique_ptr<ProcessEntry> previous;

	/**
	 * If set, the sidecar of this tenant had died; this is its
	 * port which gets swept before the current one.
	 */
	std::optional<unsigned> stale_port;

	/**
	 * Has this operation reserved #endpoint's port?
	 */
	bool port_reserved = false;

	/**
	 * Pending zombie sweep or #PortArbitration.
	 */
	CancellablePointer sub_cancel_ptr;

	enum class TimerState {
		NONE,
		ZOMBIE_GRACE,
		RETRY_COOLDOWN,
	} timer_state = TimerState::NONE;

	TimerEvent timer;

	std::unique_ptr<SidecarProcess> process;
	std::unique_ptr<StartupMonitor> monitor;

	std::vector<std::string> command;

	unsigned attempt = 0;

	SidecarStartHandler &handler;

public:
	StartOperation(Supervisor &_supervisor, std::string_view _tenant,
		       SidecarEndpoint &&_endpoint, AuthConfig &&_auth,
		       const StartOptions &_options,
		       SidecarStartHandler &_handler,
		       CancellablePointer &cancel_ptr) noexcept;

	~StartOperation() noexcept override;

	/**
	 * Enqueue in the tenant's lock.
	 */
	void Start() noexcept;

	/**
	 * A newer start request for the same tenant has arrived.
	 * Abort this operation, clean up everything it has created
	 * and report #SupersededError to its handler.
	 */
	void Supersede() noexcept;

private:
	/**
	 * Release all resources; the caller deletes this object.
	 */
	void Release() noexcept;

	void Succeed(unsigned port) noexcept;
	void Fail(std::exception_ptr error) noexcept;

	/**
	 * A failure which is not retried: set the tenant's last
	 * error and fail.
	 */
	void Abort(std::exception_ptr error) noexcept;

	void OnLocked() noexcept;
	void OnPreviousTerminated() noexcept;

	void Sweep(unsigned port) noexcept;
	void Arbitrate() noexcept;
	void Launch() noexcept;
	void AttemptFailed(std::exception_ptr error) noexcept;

	void LogStartupFailure(const StartupFailure &failure) const noexcept;

	void OnTimer() noexcept;

	/* virtual methods from class ProcessKillerHandler */
	void OnProcessKillerDone(bool killed) noexcept override;

	/* virtual methods from class PortArbitrationHandler */
	void OnPortAvailable() noexcept override;
	void OnPortUnavailable(std::exception_ptr error) noexcept override;

	/* virtual methods from class StartupMonitorHandler */
	void OnStartupBound() noexcept override;
	void OnStartupFailed(StartupFailure &&failure) noexcept override;

	/* virtual methods from class Cancellable */
	void Cancel() noexcept override;
};
