// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Supervisor.hxx"
#include "StartOperation.hxx"
#include "StopOperation.hxx"
#include "PortArbitration.hxx"
#include "PortProcessKiller.hxx"
#include "ProcessTable.hxx"
#include "Handler.hxx"
#include "Error.hxx"

#include <algorithm>

static std::unique_ptr<ProcessKiller>
MakeDefaultKiller(ThreadQueue &queue, const SupervisorConfig &config)
{
	return std::make_unique<PortProcessKiller>(queue,
						   CreateProcessTable(config.command_timeout),
						   config.GetSignature());
}

Supervisor::Supervisor(EventLoop &_event_loop,
		       const SupervisorConfig &_config,
		       std::unique_ptr<ProcessKiller> _killer)
	:event_loop(_event_loop), config(_config),
	 logger("sidecar"),
	 child_registry(event_loop),
	 thread_queue(event_loop),
	 thread_worker(thread_queue),
	 killer(_killer
		? std::move(_killer)
		: MakeDefaultKiller(thread_queue, config)),
	 registry(event_loop)
{
	if (config.enabled)
		logger.Fmt(4, "Sidecar support is enabled (executable '{}')",
			   config.executable);
	else
		logger(4, "Sidecar support is disabled");
}

Supervisor::~Supervisor() noexcept
{
	/* each Cancel() call unlinks at least the front item */
	while (!operations.empty())
		operations.front().Cancel();
}

void
Supervisor::CheckEnabled(std::string_view tenant) const
{
	if (!config.enabled)
		throw DisabledError(tenant);
}

StartOptions
Supervisor::GetDefaultStartOptions() const noexcept
{
	return {
		config.max_retries,
		config.startup_checks,
		config.startup_delay,
	};
}

PidSet
Supervisor::CollectTrackedPids() const noexcept
{
	PidSet result = registry.GetTrackedPids();
	child_registry.ForEachPid([&result](pid_t pid){
		result.insert(pid);
	});
	return result;
}

void
Supervisor::Start(std::string_view tenant,
		  std::string_view primary_url, std::string_view legacy_url,
		  const AuthConfig *auth, const StartOptions &options,
		  SidecarStartHandler &handler,
		  CancellablePointer &cancel_ptr) noexcept
{
	if (!config.enabled) {
		handler.OnSidecarError(std::make_exception_ptr(DisabledError(tenant)));
		return;
	}

	if (StartOperation *previous = registry.GetActiveStart(tenant))
		previous->Supersede();

	SidecarEndpoint endpoint;

	try {
		if (auth == nullptr)
			throw ConfigurationError(tenant, "No auth settings provided");

		try {
			ValidateAuthConfig(*auth);

			auto address = GetListenAddress(*auth);
			endpoint.host = std::move(address.host);
			endpoint.port = address.port;
		} catch (const std::invalid_argument &e) {
			throw ConfigurationError(tenant, e.what());
		}
	} catch (const ConfigurationError &e) {
		logger(1, "Invalid configuration for tenant ", tenant, ": ", e);
		registry.SetLastError(tenant, e.what());
		handler.OnSidecarError(std::current_exception());
		return;
	}

	endpoint.primary_url = primary_url;
	endpoint.legacy_url = legacy_url.empty()
		? DefaultLegacyUrl(primary_url)
		: std::string{legacy_url};

	StartOptions o = options;
	o.max_retries = std::max(o.max_retries, 1U);
	o.max_startup_checks = std::max(o.max_startup_checks, 1U);

	AuthConfig auth_copy = *auth;

	auto *operation = new StartOperation(*this, tenant,
					     std::move(endpoint),
					     std::move(auth_copy),
					     o, handler, cancel_ptr);
	operation->Start();
}

void
Supervisor::Stop(std::string_view tenant,
		 SidecarStopHandler &handler,
		 CancellablePointer &cancel_ptr) noexcept
{
	if (!config.enabled) {
		handler.OnSidecarStopError(std::make_exception_ptr(DisabledError(tenant)));
		return;
	}

	auto *operation = new StopOperation(*this, tenant, handler, cancel_ptr);
	operation->Start();
}

void
Supervisor::StopAll(SidecarStopHandler &handler,
		    CancellablePointer &cancel_ptr) noexcept
{
	if (!config.enabled) {
		handler.OnSidecarStopError(std::make_exception_ptr(DisabledError(std::string_view{})));
		return;
	}

	logger(3, "Stopping all sidecars");

	auto *operation = new StopAllOperation(*this, handler, cancel_ptr);
	operation->Start();
}

void
Supervisor::EnsurePortAvailable(unsigned port, std::string_view tenant,
				PortArbitrationHandler &handler,
				CancellablePointer &cancel_ptr) noexcept
{
	if (!config.enabled) {
		handler.OnPortUnavailable(std::make_exception_ptr(DisabledError(tenant)));
		return;
	}

	auto *operation = new PortArbitration(*this, tenant, port,
					      handler, cancel_ptr);
	operation->Start();
}

std::optional<unsigned>
Supervisor::GetPort(std::string_view tenant) const
{
	CheckEnabled(tenant);
	return registry.GetPort(tenant);
}

std::optional<std::string>
Supervisor::GetLastError(std::string_view tenant) const
{
	CheckEnabled(tenant);
	return registry.GetLastError(tenant);
}
