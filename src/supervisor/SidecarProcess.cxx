// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SidecarProcess.hxx"
#include "spawn/Direct.hxx"
#include "spawn/Prepared.hxx"
#include "spawn/Registry.hxx"
#include "Error.hxx"

#include <fmt/format.h>

#include <chrono>
#include <utility>

#include <errno.h>
#include <signal.h>
#include <string.h>

/**
 * How long does the #ChildProcessRegistry wait before repeating
 * SIGKILL for a process we have abandoned?
 */
static constexpr auto ABANDON_KILL_TIMEOUT = std::chrono::seconds{2};

static pid_t
Spawn(std::vector<std::string> &&args, OutputCapture &capture)
{
	PreparedChildProcess p;
	p.args = std::move(args);
	capture.Prepare(p);

	const pid_t pid = SpawnChildProcess(std::move(p));
	capture.Start();
	return pid;
}

SidecarProcess::SidecarProcess(EventLoop &event_loop,
			       ChildProcessRegistry &_child_registry,
			       const Logger &_logger, std::string_view _name,
			       std::vector<std::string> &&args,
			       std::unique_ptr<OutputCapture> &&_capture)
	:child_registry(_child_registry), logger(_logger), name(_name),
	 capture(std::move(_capture)),
	 pid(Spawn(std::move(args), *capture)),
	 terminate_timer(event_loop, BIND_THIS_METHOD(OnTerminateTimer)),
	 terminated_event(event_loop, BIND_THIS_METHOD(OnTerminated))
{
	child_registry.Add(pid, name, this);
}

SidecarProcess::~SidecarProcess() noexcept
{
	if (!exited)
		/* this also unregisters our ExitListener */
		child_registry.Kill(pid, SIGKILL, ABANDON_KILL_TIMEOUT);
}

bool
SidecarProcess::IsAlive() noexcept
{
	if (!exited)
		/* if the process has exited, this invokes
		   OnChildProcessExit() */
		child_registry.Check(pid);

	return !exited;
}

void
SidecarProcess::Terminate(Duration grace, Duration _kill_wait,
			  Callback callback) noexcept
{
	terminate_callback = callback;
	kill_wait = _kill_wait;
	terminate_error = nullptr;

	if (exited) {
		logger(5, "Sidecar process ", pid, " was already terminated");
		terminated_event.Schedule();
		return;
	}

	logger(5, "Terminating sidecar process ", pid);

	if (kill(pid, SIGTERM) < 0) {
		SetTerminateError(fmt::format("Failed to send SIGTERM to sidecar process {}: {}",
					      pid, strerror(errno)));
		SendKill();
		return;
	}

	terminate_state = TerminateState::GRACEFUL;
	terminate_timer.Schedule(grace);
}

void
SidecarProcess::SendKill() noexcept
{
	if (kill(pid, SIGKILL) < 0)
		SetTerminateError(fmt::format("Failed to send SIGKILL to sidecar process {}: {}",
					      pid, strerror(errno)));

	/* even if kill() has failed, wait for the exit; the process
	   may be a zombie which has not been reaped yet */
	terminate_state = TerminateState::KILLED;
	terminate_timer.Schedule(kill_wait);
}

void
SidecarProcess::SetTerminateError(std::string_view message) noexcept
{
	terminate_error = std::make_exception_ptr(TeardownError(name, message));
}

void
SidecarProcess::FinishTerminate() noexcept
{
	terminate_state = TerminateState::NONE;
	terminate_timer.Cancel();
	terminated_event.Schedule();
}

void
SidecarProcess::OnTerminateTimer() noexcept
{
	switch (terminate_state) {
	case TerminateState::NONE:
		break;

	case TerminateState::GRACEFUL:
		logger(2, "Sidecar process ", pid,
		       " did not terminate gracefully, force killing");
		SendKill();
		break;

	case TerminateState::KILLED:
		SetTerminateError(fmt::format("Sidecar process {} did not exit after SIGKILL",
					      pid));
		FinishTerminate();
		break;
	}
}

void
SidecarProcess::OnTerminated() noexcept
{
	auto callback = std::exchange(terminate_callback, nullptr);
	if (callback)
		callback();
}

void
SidecarProcess::OnChildProcessExit(int status) noexcept
{
	exited = true;
	exit_status = status;

	if (terminate_state != TerminateState::NONE)
		FinishTerminate();
}
