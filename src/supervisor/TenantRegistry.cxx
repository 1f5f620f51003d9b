// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TenantRegistry.hxx"
#include "AsyncMutex.hxx"
#include "SidecarProcess.hxx"

#include <cassert>

ProcessEntry::ProcessEntry(std::string_view _tenant,
			   std::unique_ptr<SidecarProcess> &&_process,
			   SidecarEndpoint &&_endpoint,
			   AuthConfig &&_auth) noexcept
	:tenant(_tenant), process(std::move(_process)),
	 endpoint(std::move(_endpoint)), auth(std::move(_auth)),
	 pid(process->GetPid())
{
}

ProcessEntry::~ProcessEntry() noexcept = default;

TenantRegistry::TenantRegistry(EventLoop &_event_loop) noexcept
	:event_loop(_event_loop)
{
}

TenantRegistry::~TenantRegistry() noexcept
{
	assert(active_starts.empty());
	assert(port_reservations.empty());
}

void
TenantRegistry::Add(std::unique_ptr<ProcessEntry> &&entry) noexcept
{
	const std::scoped_lock lock{mutex};

	assert(!entries.contains(entry->tenant));
	assert(!port_owners.contains(entry->endpoint.port));

	port_owners.insert_or_assign(entry->endpoint.port, entry->tenant);
	pid_owners.insert_or_assign(entry->pid, entry->tenant);

	if (auto r = port_reservations.find(entry->endpoint.port);
	    r != port_reservations.end() && r->second == entry->tenant)
		port_reservations.erase(r);

	auto tenant = entry->tenant;
	entries.emplace(std::move(tenant), std::move(entry));
}

std::unique_ptr<ProcessEntry>
TenantRegistry::Remove(std::string_view tenant) noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = entries.find(tenant);
	if (i == entries.end())
		return nullptr;

	auto entry = std::move(i->second);
	entries.erase(i);

	/* release only what this entry owns */

	if (auto p = port_owners.find(entry->endpoint.port);
	    p != port_owners.end() && p->second == entry->tenant)
		port_owners.erase(p);

	if (auto p = pid_owners.find(entry->pid);
	    p != pid_owners.end() && p->second == entry->tenant)
		pid_owners.erase(p);

	return entry;
}

ProcessEntry *
TenantRegistry::Find(std::string_view tenant) noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = entries.find(tenant);
	if (i == entries.end())
		return nullptr;

	return i->second.get();
}

bool
TenantRegistry::IsAlive(std::string_view tenant) noexcept
{
	/* no need to lock: modifications happen only in this
	   thread */
	auto *entry = Find(tenant);
	return entry != nullptr && entry->process->IsAlive();
}

bool
TenantRegistry::Contains(std::string_view tenant) const noexcept
{
	const std::scoped_lock lock{mutex};
	return entries.find(tenant) != entries.end();
}

std::optional<unsigned>
TenantRegistry::GetPort(std::string_view tenant) const noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = entries.find(tenant);
	if (i == entries.end())
		return std::nullopt;

	return i->second->endpoint.port;
}

std::optional<std::string>
TenantRegistry::GetPortOwner(unsigned port) const noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = port_owners.find(port);
	if (i == port_owners.end())
		return std::nullopt;

	return i->second;
}

std::optional<std::string>
TenantRegistry::GetPidOwner(pid_t pid) const noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = pid_owners.find(pid);
	if (i == pid_owners.end())
		return std::nullopt;

	return i->second;
}

PidSet
TenantRegistry::GetTrackedPids() const noexcept
{
	const std::scoped_lock lock{mutex};

	PidSet result;
	for (const auto &[pid, tenant] : pid_owners)
		result.insert(pid);
	return result;
}

std::vector<std::string>
TenantRegistry::GetTenants() const noexcept
{
	const std::scoped_lock lock{mutex};

	std::vector<std::string> result;
	result.reserve(entries.size());
	for (const auto &[tenant, entry] : entries)
		result.push_back(tenant);
	return result;
}

void
TenantRegistry::SetLastError(std::string_view tenant,
			     std::string_view message) noexcept
{
	const std::scoped_lock lock{mutex};
	last_errors.insert_or_assign(std::string{tenant}, std::string{message});
}

void
TenantRegistry::ClearLastError(std::string_view tenant) noexcept
{
	const std::scoped_lock lock{mutex};

	if (auto i = last_errors.find(tenant); i != last_errors.end())
		last_errors.erase(i);
}

std::optional<std::string>
TenantRegistry::GetLastError(std::string_view tenant) const noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = last_errors.find(tenant);
	if (i == last_errors.end())
		return std::nullopt;

	return i->second;
}

AsyncMutex &
TenantRegistry::GetLock(std::string_view tenant) noexcept
{
	auto i = locks.find(tenant);
	if (i == locks.end())
		i = locks.emplace(std::string{tenant},
				  std::make_unique<AsyncMutex>(event_loop)).first;

	return *i->second;
}

void
TenantRegistry::ReleaseLock(std::string_view tenant) noexcept
{
	auto i = locks.find(tenant);
	if (i != locks.end() && i->second->IsIdle())
		locks.erase(i);
}

StartOperation *
TenantRegistry::GetActiveStart(std::string_view tenant) const noexcept
{
	auto i = active_starts.find(tenant);
	if (i == active_starts.end())
		return nullptr;

	return i->second;
}

void
TenantRegistry::SetActiveStart(std::string_view tenant,
			       StartOperation &operation) noexcept
{
	active_starts.insert_or_assign(std::string{tenant}, &operation);
}

void
TenantRegistry::ClearActiveStart(std::string_view tenant,
				 const StartOperation &operation) noexcept
{
	auto i = active_starts.find(tenant);
	if (i != active_starts.end() && i->second == &operation)
		active_starts.erase(i);
}

std::vector<StartOperation *>
TenantRegistry::GetActiveStarts() const noexcept
{
	std::vector<StartOperation *> result;
	result.reserve(active_starts.size());
	for (const auto &[tenant, operation] : active_starts)
		result.push_back(operation);
	return result;
}

bool
TenantRegistry::ReservePort(unsigned port, std::string_view tenant) noexcept
{
	auto [i, inserted] = port_reservations.try_emplace(port, tenant);
	return inserted || i->second == tenant;
}

void
TenantRegistry::UnreservePort(unsigned port, std::string_view tenant) noexcept
{
	auto i = port_reservations.find(port);
	if (i != port_reservations.end() && i->second == tenant)
		port_reservations.erase(i);
}

std::optional<std::string>
TenantRegistry::GetPortReservation(unsigned port) const noexcept
{
	auto i = port_reservations.find(port);
	if (i == port_reservations.end())
		return std::nullopt;

	return i->second;
}
