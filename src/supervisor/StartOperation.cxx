// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StartOperation.hxx"
#include "PortArbitration.hxx"
#include "SidecarProcess.hxx"
#include "ConfigDiffer.hxx"
#include "Error.hxx"
#include "util/Exception.hxx"

#include <utility>

#include <sys/wait.h>

/**
 * Returns the message of the outermost exception; this is what gets
 * stored as the tenant's last error.
 */
static std::string
GetErrorMessage(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return e.what();
	} catch (...) {
		return GENERIC_STARTUP_ERROR_MESSAGE;
	}
}

StartOperation::StartOperation(Supervisor &_supervisor,
			       std::string_view _tenant,
			       SidecarEndpoint &&_endpoint, AuthConfig &&_auth,
			       const StartOptions &_options,
			       SidecarStartHandler &_handler,
			       CancellablePointer &cancel_ptr) noexcept
	:supervisor(_supervisor),
	 logger(supervisor.logger.GetDomain(), _tenant),
	 tenant(_tenant),
	 endpoint(std::move(_endpoint)), auth(std::move(_auth)),
	 options(_options),
	 lock(supervisor.registry.GetLock(tenant)),
	 lock_waiter(BIND_THIS_METHOD(OnLocked)),
	 timer(supervisor.event_loop, BIND_THIS_METHOD(OnTimer)),
	 handler(_handler)
{
	supervisor.AddOperation(*this);
	supervisor.registry.SetActiveStart(tenant, *this);
	cancel_ptr = *this;
}

StartOperation::~StartOperation() noexcept = default;

void
StartOperation::Start() noexcept
{
	lock.Lock(lock_waiter);
}

void
StartOperation::Release() noexcept
{
	sub_cancel_ptr.CancelIfDefined();
	timer.Cancel();

	/* the monitor references the process */
	monitor.reset();
	process.reset();
	previous.reset();

	if (port_reserved) {
		port_reserved = false;
		supervisor.registry.UnreservePort(endpoint.port, tenant);
	}

	lock_waiter.Cancel();
	if (locked) {
		locked = false;
		lock.Unlock();
	}

	supervisor.registry.ClearActiveStart(tenant, *this);
}

void
StartOperation::Succeed(unsigned port) noexcept
{
	auto &_handler = handler;
	Release();
	delete this;
	_handler.OnSidecarReady(port);
}

void
StartOperation::Fail(std::exception_ptr error) noexcept
{
	auto &_handler = handler;
	Release();
	delete this;
	_handler.OnSidecarError(std::move(error));
}

void
StartOperation::Abort(std::exception_ptr error) noexcept
{
	logger(1, "Failed to start sidecar (not retrying): ", error);
	supervisor.registry.SetLastError(tenant, GetErrorMessage(error));
	Fail(std::move(error));
}

void
StartOperation::Supersede() noexcept
{
	logger(3, "Cancelling previous start operation");

	const std::string _tenant = tenant;
	Fail(std::make_exception_ptr(SupersededError(_tenant)));
}

void
StartOperation::OnLocked() noexcept
{
	locked = true;

	logger.Fmt(3, "Starting sidecar on {}:{}", endpoint.host, endpoint.port);

	auto &registry = supervisor.registry;

	if (ProcessEntry *entry = registry.Find(tenant); entry != nullptr) {
		if (entry->process->IsAlive()) {
			if (!HasAuthConfigChanged(&entry->auth, &auth)) {
				logger(4, "Sidecar is already running with the current configuration");
				Succeed(entry->endpoint.port);
				return;
			}

			logger(3, "Authentication settings have changed; restarting the sidecar");
			previous = registry.Remove(tenant);
			previous->process->Terminate(supervisor.config.stop_grace,
						     supervisor.config.kill_wait,
						     BIND_THIS_METHOD(OnPreviousTerminated));
			return;
		}

		logger.Fmt(2, "Sidecar process {} has died; restarting", entry->pid);

		const unsigned old_port = entry->endpoint.port;
		registry.Remove(tenant);

		if (old_port != endpoint.port)
			stale_port = old_port;
	}

	Sweep(stale_port ? *stale_port : endpoint.port);
}

void
StartOperation::OnPreviousTerminated() noexcept
{
	if (auto error = previous->process->GetTerminateError())
		logger(2, "Failed to stop the previous sidecar: ", error);

	previous.reset();
	Sweep(endpoint.port);
}

void
StartOperation::Sweep(unsigned port) noexcept
{
	logger.Fmt(5, "Checking for zombie processes on port {}", port);

	supervisor.killer->KillZombieProcessesForPort(port,
						      supervisor.CollectTrackedPids(),
						      *this, sub_cancel_ptr);
}

void
StartOperation::OnProcessKillerDone(bool killed) noexcept
{
	sub_cancel_ptr = nullptr;

	if (stale_port) {
		stale_port.reset();
		Sweep(endpoint.port);
		return;
	}

	if (killed) {
		logger(4, "Killed zombie processes; waiting before the port check");
		timer_state = TimerState::ZOMBIE_GRACE;
		timer.Schedule(supervisor.config.zombie_grace);
		return;
	}

	Arbitrate();
}

void
StartOperation::Arbitrate() noexcept
{
	auto *arbitration = new PortArbitration(supervisor, tenant,
						endpoint.port,
						*this, sub_cancel_ptr);
	arbitration->Start();
}

void
StartOperation::OnPortAvailable() noexcept
{
	sub_cancel_ptr = nullptr;

	if (!supervisor.registry.ReservePort(endpoint.port, tenant)) {
		Abort(std::make_exception_ptr(MakeOtherTenantConflict(tenant,
								      endpoint.port)));
		return;
	}

	port_reserved = true;
	Launch();
}

void
StartOperation::OnPortUnavailable(std::exception_ptr error) noexcept
{
	sub_cancel_ptr = nullptr;
	Abort(std::move(error));
}

void
StartOperation::Launch() noexcept
{
	++attempt;

	logger.Fmt(3, "Starting sidecar (attempt {}/{})",
		   attempt, options.max_retries);

	const auto &config = supervisor.config;

	try {
		command = BuildCommandLine(config, endpoint, auth);
		logger(4, "Sidecar command: ",
		       JoinCommandLine(RedactCommandLine(command)));

		auto capture = CreateOutputCapture(config.capture,
						   supervisor.event_loop,
						   logger, tenant);

		auto args = command;
		process = std::make_unique<SidecarProcess>(supervisor.event_loop,
							   supervisor.child_registry,
							   logger, tenant,
							   std::move(args),
							   std::move(capture));
	} catch (...) {
		logger(1, "Failed to launch sidecar: ", std::current_exception());
		AttemptFailed(std::make_exception_ptr(StartupError(tenant,
								   GetFullMessage(std::current_exception()))));
		return;
	}

	logger.Fmt(4, "Sidecar process started with pid {}; waiting for port {}",
		   process->GetPid(), endpoint.port);

	monitor = std::make_unique<StartupMonitor>(supervisor.event_loop,
						   logger, *process,
						   supervisor.classifier,
						   auth.Get("oauth_server_url"),
						   endpoint.port,
						   options.max_startup_checks,
						   options.startup_delay,
						   config.stop_grace,
						   config.kill_wait,
						   static_cast<StartupMonitorHandler &>(*this));
	monitor->Start();
}

void
StartOperation::LogStartupFailure(const StartupFailure &failure) const noexcept
{
	logger(1, "Sidecar startup failed:");

	if (failure.exit_status) {
		const int status = *failure.exit_status;
		if (WIFSIGNALED(status))
			logger.Fmt(1, "  - Process was killed by signal {}",
				   WTERMSIG(status));
		else
			logger.Fmt(1, "  - Process died with exit code: {}",
				   WEXITSTATUS(status));
	} else
		logger.Fmt(1, "  - Process was running (PID: {}) but failed to bind to port {}",
			   process->GetPid(), endpoint.port);

	logger.Fmt(1, "  - Target: {}:{}", endpoint.host, endpoint.port);
	logger(1, "  - Command: ", JoinCommandLine(RedactCommandLine(command)));

	if (!failure.output.stderr_text.empty())
		logger(1, "  - Error output: ", failure.output.stderr_text);

	if (!failure.output.stdout_text.empty())
		logger(1, "  - Standard output: ", failure.output.stdout_text);

	logger(1, "  - Error message: ", failure.message);
}

void
StartOperation::OnStartupBound() noexcept
{
	monitor.reset();
	process->GetCapture().Detach();

	const unsigned port = endpoint.port;
	const pid_t pid = process->GetPid();

	auto &registry = supervisor.registry;

	if (const auto owner = registry.GetPortOwner(port);
	    owner && *owner != tenant) {
		if (registry.IsAlive(*owner)) {
			/* Release() kills our process */
			logger.Fmt(1, "Port {} has been claimed by tenant {} meanwhile; discarding this sidecar",
				   port, *owner);
			Abort(std::make_exception_ptr(MakeOtherTenantConflict(tenant,
									      port)));
			return;
		}

		registry.Remove(*owner);
	}

	/* Add() drops the reservation */
	port_reserved = false;

	registry.Add(std::make_unique<ProcessEntry>(tenant, std::move(process),
						    std::move(endpoint),
						    std::move(auth)));
	registry.ClearLastError(tenant);

	logger.Fmt(3, "Sidecar started on port {} (pid {}) after {} attempt(s)",
		   port, pid, attempt);

	Succeed(port);
}

void
StartOperation::OnStartupFailed(StartupFailure &&failure) noexcept
{
	LogStartupFailure(failure);

	monitor.reset();
	process.reset();

	AttemptFailed(std::make_exception_ptr(StartupError(tenant,
							   failure.message)));
}

void
StartOperation::AttemptFailed(std::exception_ptr error) noexcept
{
	logger.Fmt(2, "Start attempt {}/{} failed: {}",
		   attempt, options.max_retries, GetErrorMessage(error));

	if (attempt < options.max_retries) {
		logger.Fmt(3, "Waiting {}ms before the next attempt",
			   supervisor.config.retry_cooldown.count());
		timer_state = TimerState::RETRY_COOLDOWN;
		timer.Schedule(supervisor.config.retry_cooldown);
		return;
	}

	logger.Fmt(1, "Failed to start sidecar after {} attempt(s)", attempt);
	supervisor.registry.SetLastError(tenant, GetErrorMessage(error));
	Fail(std::move(error));
}

void
StartOperation::OnTimer() noexcept
{
	const auto state = std::exchange(timer_state, TimerState::NONE);

	switch (state) {
	case TimerState::NONE:
		break;

	case TimerState::ZOMBIE_GRACE:
		Arbitrate();
		break;

	case TimerState::RETRY_COOLDOWN:
		/* a killed attempt may have left orphans behind */
		Sweep(endpoint.port);
		break;
	}
}

void
StartOperation::Cancel() noexcept
{
	logger(4, "Start operation cancelled");

	Release();
	delete this;
}
