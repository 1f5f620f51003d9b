// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "AuthConfig.hxx"
#include "CommandLine.hxx"
#include "ProcessKiller.hxx"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

class EventLoop;
class AsyncMutex;
class SidecarProcess;
class StartOperation;

/**
 * A sidecar which has been started successfully.
 */
struct ProcessEntry {
	const std::string tenant;

	std::unique_ptr<SidecarProcess> process;

	const SidecarEndpoint endpoint;

	const AuthConfig auth;

	const pid_t pid;

	ProcessEntry(std::string_view _tenant,
		     std::unique_ptr<SidecarProcess> &&_process,
		     SidecarEndpoint &&_endpoint,
		     AuthConfig &&_auth) noexcept;

	~ProcessEntry() noexcept;

	ProcessEntry(const ProcessEntry &) = delete;
	ProcessEntry &operator=(const ProcessEntry &) = delete;
};

/**
 * The shared state of all tenants: their processes, the ownership
 * of ports and process ids, the last error message of each tenant
 * and the per-tenant locks.
 *
 * A port or pid is owned by a tenant if and only if the tenant's
 * #ProcessEntry references it.  While a start operation is in
 * flight, its port is reserved for the tenant so no other tenant can
 * claim it before the process has bound it.
 *
 * All modifications happen in the event loop thread.  The maps are
 * protected by a mutex so other threads may call the read-only
 * accessors.  The locks, port reservations and active start
 * operations are accessed only from the event loop thread.
 */
class TenantRegistry {
	EventLoop &event_loop;

	mutable std::mutex mutex;

	std::map<std::string, std::unique_ptr<ProcessEntry>, std::less<>> entries;

	std::map<unsigned, std::string> port_owners;

	std::map<pid_t, std::string> pid_owners;

	std::map<std::string, std::string, std::less<>> last_errors;

	std::map<std::string, std::unique_ptr<AsyncMutex>, std::less<>> locks;

	std::map<std::string, StartOperation *, std::less<>> active_starts;

	std::map<unsigned, std::string> port_reservations;

public:
	explicit TenantRegistry(EventLoop &_event_loop) noexcept;

	/**
	 * Kills all remaining processes.
	 */
	~TenantRegistry() noexcept;

	TenantRegistry(const TenantRegistry &) = delete;
	TenantRegistry &operator=(const TenantRegistry &) = delete;

	/**
	 * Register a started sidecar and claim its port and pid.  The
	 * tenant must not have an entry, and the port must not be
	 * owned by another tenant.  A reservation of the port by this
	 * tenant is dropped.
	 */
	void Add(std::unique_ptr<ProcessEntry> &&entry) noexcept;

	/**
	 * Remove the tenant's entry and release its port and pid.
	 *
	 * @return the entry (nullptr if there was none); destroying
	 * it kills the process
	 */
	std::unique_ptr<ProcessEntry> Remove(std::string_view tenant) noexcept;

	/**
	 * Event loop thread only.
	 */
	[[gnu::pure]]
	ProcessEntry *Find(std::string_view tenant) noexcept;

	/**
	 * Does the tenant have an entry with a running process?
	 * Event loop thread only.
	 */
	bool IsAlive(std::string_view tenant) noexcept;

	[[gnu::pure]]
	bool Contains(std::string_view tenant) const noexcept;

	std::optional<unsigned> GetPort(std::string_view tenant) const noexcept;

	std::optional<std::string> GetPortOwner(unsigned port) const noexcept;

	std::optional<std::string> GetPidOwner(pid_t pid) const noexcept;

	/**
	 * Returns the process ids of all registered sidecars.
	 */
	PidSet GetTrackedPids() const noexcept;

	std::vector<std::string> GetTenants() const noexcept;

	void SetLastError(std::string_view tenant,
			  std::string_view message) noexcept;

	void ClearLastError(std::string_view tenant) noexcept;

	std::optional<std::string> GetLastError(std::string_view tenant) const noexcept;

	/**
	 * Return the tenant's lock, creating it on first use.
	 */
	AsyncMutex &GetLock(std::string_view tenant) noexcept;

	/**
	 * Delete the tenant's lock if nobody holds or waits for it.
	 */
	void ReleaseLock(std::string_view tenant) noexcept;

	[[gnu::pure]]
	StartOperation *GetActiveStart(std::string_view tenant) const noexcept;

	void SetActiveStart(std::string_view tenant,
			    StartOperation &operation) noexcept;

	/**
	 * Forget the tenant's active start operation, but only if it
	 * is the given one.
	 */
	void ClearActiveStart(std::string_view tenant,
			      const StartOperation &operation) noexcept;

	std::vector<StartOperation *> GetActiveStarts() const noexcept;

	/**
	 * Reserve the port for a pending start of this tenant.
	 *
	 * @return false if another tenant has already reserved it
	 */
	bool ReservePort(unsigned port, std::string_view tenant) noexcept;

	/**
	 * Drop the reservation, but only if it belongs to this
	 * tenant.
	 */
	void UnreservePort(unsigned port, std::string_view tenant) noexcept;

	std::optional<std::string> GetPortReservation(unsigned port) const noexcept;
};
