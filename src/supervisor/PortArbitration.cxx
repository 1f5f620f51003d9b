// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PortArbitration.hxx"
#include "Supervisor.hxx"
#include "Handler.hxx"
#include "Error.hxx"
#include "ProcessKiller.hxx"
#include "net/PortProbe.hxx"

#include <fmt/format.h>

static ConfigurationError
MakeInvalidPortError(std::string_view tenant, unsigned port) noexcept
{
	return ConfigurationError(tenant,
				  fmt::format("Invalid port number: {}. Port must be an integer between 1 and 65535.",
					      port));
}

PortConflictError
MakeOtherTenantConflict(std::string_view tenant, unsigned port) noexcept
{
	return PortConflictError(tenant,
				 fmt::format("Port {} is already in use by another project. "
					     "Please choose a different port (e.g., {}) "
					     "or disable OAuth on the other project first.",
					     port, port + 1));
}

PortArbitration::PortArbitration(Supervisor &_supervisor,
				 std::string_view _tenant, unsigned _port,
				 PortArbitrationHandler &_handler,
				 CancellablePointer &cancel_ptr) noexcept
	:supervisor(_supervisor),
	 logger(supervisor.logger.GetDomain(), _tenant),
	 tenant(_tenant), port(_port),
	 release_timer(supervisor.event_loop, BIND_THIS_METHOD(OnReleaseTimer)),
	 handler(_handler)
{
	supervisor.AddOperation(*this);
	cancel_ptr = *this;
}

PortArbitration::~PortArbitration() noexcept = default;

void
PortArbitration::Succeed() noexcept
{
	auto &_handler = handler;
	Destroy();
	_handler.OnPortAvailable();
}

void
PortArbitration::Fail(std::exception_ptr error) noexcept
{
	auto &_handler = handler;
	Destroy();
	_handler.OnPortUnavailable(std::move(error));
}

bool
PortArbitration::ProbeFree() const
{
	try {
		return IsPortFree(port);
	} catch (const std::invalid_argument &) {
		std::throw_with_nested(MakeInvalidPortError(tenant, port));
	}
}

void
PortArbitration::Start() noexcept
{
	try {
		Run();
	} catch (...) {
		Fail(std::current_exception());
	}
}

void
PortArbitration::Run()
{
	if (!IsValidPort(port))
		throw MakeInvalidPortError(tenant, port);

	auto &registry = supervisor.registry;

	if (const auto holder = registry.GetPortReservation(port);
	    holder && *holder != tenant) {
		logger.Fmt(1, "Port {} is being claimed by tenant {}; refusing to start",
			   port, *holder);
		throw MakeOtherTenantConflict(tenant, port);
	}

	const bool free = ProbeFree();
	logger.Fmt(5, "Port {} availability check: {}",
		   port, free ? "available" : "in use");
	if (free) {
		Succeed();
		return;
	}

	if (const auto owner = registry.GetPortOwner(port);
	    owner && *owner != tenant) {
		if (registry.IsAlive(*owner)) {
			logger.Fmt(1, "Port {} is in use by tenant {}; refusing to start", port, *owner);
			throw MakeOtherTenantConflict(tenant, port);
		}

		logger.Fmt(4, "Port {} was owned by tenant {} whose process has died; taking it over",
			   port, *owner);
		registry.Remove(*owner);
	}

	if (const auto owner = registry.GetPortOwner(port);
	    owner && *owner == tenant) {
		const bool alive = registry.IsAlive(tenant);

		/* destroying the entry kills our own process; anything
		   else which still listens on the port is killed
		   below */
		registry.Remove(tenant);

		if (!alive) {
			logger.Fmt(4, "Port {} was owned by this tenant whose process has died; releasing it",
				   port);

			if (ProbeFree()) {
				Succeed();
				return;
			}

			RefuseForeign();
			return;
		}

		logger.Fmt(4, "Port {} is in use by this tenant's sidecar; killing it", port);
		supervisor.killer->KillProcessOnPort(port, *this, kill_cancel_ptr);
		return;
	}

	RefuseForeign();
}

void
PortArbitration::RefuseForeign() noexcept
{
	logger.Fmt(1, "Port {} is in use by an unknown process which will not be killed", port);

	Fail(std::make_exception_ptr(PortConflictError(tenant,
						       fmt::format("Port {} is already in use by another application. "
								   "Please choose a different port (e.g., {}) "
								   "or free up the port manually.",
								   port, port + 1))));
}

void
PortArbitration::ReprobeAfterKill() noexcept
{
	bool free;

	try {
		free = ProbeFree();
	} catch (...) {
		Fail(std::current_exception());
		return;
	}

	if (free) {
		logger.Fmt(4, "Port {} has been released", port);
		Succeed();
		return;
	}

	logger.Fmt(1, "Port {} is still in use after killing process", port);
	Fail(std::make_exception_ptr(PortConflictError(tenant,
						       fmt::format("Port {} is still in use after killing process",
								   port))));
}

void
PortArbitration::OnReleaseTimer() noexcept
{
	ReprobeAfterKill();
}

void
PortArbitration::OnProcessKillerDone(bool killed) noexcept
{
	kill_cancel_ptr = nullptr;

	if (killed)
		/* give the kernel some time to release the socket */
		release_timer.Schedule(supervisor.config.port_release);
	else
		ReprobeAfterKill();
}

void
PortArbitration::Cancel() noexcept
{
	kill_cancel_ptr.CancelIfDefined();
	Destroy();
}
