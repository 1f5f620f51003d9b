// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "ErrorClassifier.hxx"
#include "TenantRegistry.hxx"
#include "Operation.hxx"
#include "spawn/Registry.hxx"
#include "thread/Queue.hxx"
#include "thread/Worker.hxx"
#include "io/Logger.hxx"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class EventLoop;
class CancellablePointer;
class ProcessKiller;
class SidecarStartHandler;
class SidecarStopHandler;
class PortArbitrationHandler;

/**
 * Per-request overrides of the startup parameters.
 */
struct StartOptions {
	/**
	 * The number of start attempts.
	 */
	unsigned max_retries;

	/**
	 * The number of port checks per attempt.
	 */
	unsigned max_startup_checks;

	/**
	 * The interval between two port checks.
	 */
	std::chrono::milliseconds startup_delay;
};

/**
 * Manages one sidecar process per tenant: starts it on the tenant's
 * configured port, restarts it when its authentication settings
 * change, stops it on request and reports errors.
 *
 * All methods must be called in the event loop thread, except for
 * GetPort(), GetLastError() and GetTenants() which may be called
 * from any thread.
 */
class Supervisor final {
	friend class StartOperation;
	friend class StopOperation;
	friend class StopAllOperation;
	friend class PortArbitration;

	EventLoop &event_loop;

	const SupervisorConfig config;

	const Logger logger;

	ChildProcessRegistry child_registry;

	/**
	 * Process discovery (which may block) runs in a worker
	 * thread.
	 */
	ThreadQueue thread_queue;
	ThreadWorker thread_worker;

	std::unique_ptr<ProcessKiller> killer;

	const ErrorClassifier classifier;

	TenantRegistry registry;

	SupervisorOperationList operations;

public:
	/**
	 * Throws on error.
	 *
	 * @param _killer an alternative #ProcessKiller implementation;
	 * if nullptr, a #PortProcessKiller is created
	 */
	Supervisor(EventLoop &_event_loop, const SupervisorConfig &_config,
		   std::unique_ptr<ProcessKiller> _killer=nullptr);

	/**
	 * Cancels all pending operations (without invoking their
	 * handlers) and kills all sidecar processes.
	 */
	~Supervisor() noexcept;

	Supervisor(const Supervisor &) = delete;
	Supervisor &operator=(const Supervisor &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	const SupervisorConfig &GetConfig() const noexcept {
		return config;
	}

	TenantRegistry &GetRegistry() noexcept {
		return registry;
	}

	const TenantRegistry &GetRegistry() const noexcept {
		return registry;
	}

	bool IsEnabled() const noexcept {
		return config.enabled;
	}

	/**
	 * Throws #DisabledError if the subsystem is disabled.
	 */
	void CheckEnabled(std::string_view tenant) const;

	StartOptions GetDefaultStartOptions() const noexcept;

	/**
	 * Start (or restart) the sidecar of a tenant.  If the tenant
	 * has a running sidecar with the same authentication
	 * settings, this completes immediately.  A pending start of
	 * the same tenant is superseded.
	 *
	 * The handler may be invoked before this method returns.
	 *
	 * @param primary_url the endpoint URL the sidecar serves
	 * @param legacy_url the legacy endpoint URL; if empty, it is
	 * derived from #primary_url
	 * @param auth the authentication settings (may be nullptr,
	 * which is a #ConfigurationError)
	 */
	void Start(std::string_view tenant,
		   std::string_view primary_url, std::string_view legacy_url,
		   const AuthConfig *auth, const StartOptions &options,
		   SidecarStartHandler &handler,
		   CancellablePointer &cancel_ptr) noexcept;

	void Start(std::string_view tenant, std::string_view primary_url,
		   const AuthConfig *auth,
		   SidecarStartHandler &handler,
		   CancellablePointer &cancel_ptr) noexcept {
		Start(tenant, primary_url, {}, auth,
		      GetDefaultStartOptions(),
		      handler, cancel_ptr);
	}

	/**
	 * Stop the sidecar of a tenant (if it has one) and release its
	 * port.  This waits for a pending start of the tenant to
	 * finish.
	 */
	void Stop(std::string_view tenant,
		  SidecarStopHandler &handler,
		  CancellablePointer &cancel_ptr) noexcept;

	/**
	 * Supersede all pending starts and stop all sidecars.
	 */
	void StopAll(SidecarStopHandler &handler,
		     CancellablePointer &cancel_ptr) noexcept;

	/**
	 * Make sure the port can be used by the given tenant.  See
	 * #PortArbitration.
	 */
	void EnsurePortAvailable(unsigned port, std::string_view tenant,
				 PortArbitrationHandler &handler,
				 CancellablePointer &cancel_ptr) noexcept;

	/**
	 * Returns the port of the tenant's sidecar, or std::nullopt
	 * if it has none.
	 *
	 * Throws #DisabledError.
	 */
	std::optional<unsigned> GetPort(std::string_view tenant) const;

	/**
	 * Returns the message of the tenant's most recent failure, or
	 * std::nullopt if its most recent start has succeeded.
	 *
	 * Throws #DisabledError.
	 */
	std::optional<std::string> GetLastError(std::string_view tenant) const;

	/**
	 * Does the tenant have a sidecar whose process is running?
	 */
	bool IsRunning(std::string_view tenant) noexcept {
		return registry.IsAlive(tenant);
	}

	std::vector<std::string> GetTenants() const noexcept {
		return registry.GetTenants();
	}

private:
	void AddOperation(SupervisorOperation &operation) noexcept {
		operations.push_back(operation);
	}

	/**
	 * Returns the pids of all sidecars and all other children of
	 * this process, which must never be killed by a zombie sweep.
	 */
	PidSet CollectTrackedPids() const noexcept;
};
