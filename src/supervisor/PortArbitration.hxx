// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Operation.hxx"
#include "ProcessKiller.hxx"
#include "event/TimerEvent.hxx"
#include "io/Logger.hxx"

#include <exception>
#include <string>
#include <string_view>

class Supervisor;
class PortArbitrationHandler;
class PortConflictError;

/**
 * The error for a port which is owned (or being claimed) by the
 * live sidecar of another tenant.
 */
PortConflictError
MakeOtherTenantConflict(std::string_view tenant, unsigned port) noexcept;

/**
 * Decides whether a tenant may use a port:
 *
 * - a port which another tenant's pending start has reserved is
 *   refused
 * - a free port may be used
 * - a port owned by another tenant whose process is alive is refused
 * - a port owned by another tenant whose process has died is taken
 *   over (the stale entry is evicted)
 * - a port owned by this tenant is reclaimed: a dead entry is
 *   released, a live one is killed together with everything else
 *   listening on the port
 * - a port occupied by a foreign process is refused; that process
 *   is never killed
 */
class PortArbitration final : public SupervisorOperation, ProcessKillerHandler {
	Supervisor &supervisor;

	const ChildLogger logger;

	const std::string tenant;

	const unsigned port;

	TimerEvent release_timer;

	CancellablePointer kill_cancel_ptr;

	PortArbitrationHandler &handler;

public:
	PortArbitration(Supervisor &_supervisor,
			std::string_view _tenant, unsigned _port,
			PortArbitrationHandler &_handler,
			CancellablePointer &cancel_ptr) noexcept;

	~PortArbitration() noexcept override;

	void Start() noexcept;

private:
	void Destroy() noexcept {
		delete this;
	}

	void Succeed() noexcept;
	void Fail(std::exception_ptr error) noexcept;

	/**
	 * Throws #ConfigurationError.
	 */
	bool ProbeFree() const;

	void Run();
	void RefuseForeign() noexcept;
	void ReprobeAfterKill() noexcept;

	void OnReleaseTimer() noexcept;

	/* virtual methods from class ProcessKillerHandler */
	void OnProcessKillerDone(bool killed) noexcept override;

	/* virtual methods from class Cancellable */
	void Cancel() noexcept override;
};
