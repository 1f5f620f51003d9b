// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "OutputCapture.hxx"
#include "spawn/ExitListener.hxx"
#include "event/TimerEvent.hxx"
#include "event/DeferEvent.hxx"
#include "io/Logger.hxx"

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

class ChildProcessRegistry;

/**
 * A running sidecar process.  Destroying this object kills the
 * process (if it is still running).
 */
class SidecarProcess final : ExitListener {
	ChildProcessRegistry &child_registry;

	const Logger logger;

	const std::string name;

	std::unique_ptr<OutputCapture> capture;

	const pid_t pid;

	/**
	 * The raw waitpid() status; only valid if #exited is set.
	 */
	int exit_status = -1;

	bool exited = false;

	enum class TerminateState {
		NONE,

		/**
		 * SIGTERM has been sent; #terminate_timer fires when
		 * the grace period has elapsed.
		 */
		GRACEFUL,

		/**
		 * SIGKILL has been sent; #terminate_timer fires when
		 * we give up waiting.
		 */
		KILLED,
	} terminate_state = TerminateState::NONE;

	TimerEvent terminate_timer;

	/**
	 * Invokes #terminate_callback from a clean stack frame.
	 */
	DeferEvent terminated_event;

	using Callback = BoundMethod<void() noexcept>;
	Callback terminate_callback = nullptr;

	Event::Duration kill_wait{};

	/**
	 * A #TeardownError describing why Terminate() did not go as
	 * planned.
	 */
	std::exception_ptr terminate_error;

public:
	using Duration = Event::Duration;

	/**
	 * Spawn the process and register it.
	 *
	 * Throws on error.
	 *
	 * @param _name a name for log messages (e.g. the tenant id)
	 */
	SidecarProcess(EventLoop &event_loop,
		       ChildProcessRegistry &_child_registry,
		       const Logger &_logger, std::string_view _name,
		       std::vector<std::string> &&args,
		       std::unique_ptr<OutputCapture> &&_capture);

	~SidecarProcess() noexcept;

	SidecarProcess(const SidecarProcess &) = delete;
	SidecarProcess &operator=(const SidecarProcess &) = delete;

	pid_t GetPid() const noexcept {
		return pid;
	}

	/**
	 * Check whether the process is still running.  This reaps the
	 * process if it has exited but its SIGCHLD has not been
	 * handled yet.
	 */
	bool IsAlive() noexcept;

	bool HasExited() const noexcept {
		return exited;
	}

	/**
	 * Returns the raw waitpid() status.  Only valid if
	 * HasExited() returns true.
	 */
	int GetExitStatus() const noexcept {
		return exit_status;
	}

	OutputCapture &GetCapture() noexcept {
		return *capture;
	}

	/**
	 * Send SIGTERM and wait for the process to exit.  If it does
	 * not exit within the grace period, SIGKILL is sent.  The
	 * callback is invoked when the process has exited or when we
	 * have given up waiting; it may destroy this object.
	 */
	void Terminate(Duration grace, Duration _kill_wait,
		       Callback callback) noexcept;

	/**
	 * After Terminate() has finished: was there a problem
	 * signalling the process, or did it refuse to exit?  Returns
	 * a #TeardownError or nullptr.
	 */
	std::exception_ptr GetTerminateError() const noexcept {
		return terminate_error;
	}

private:
	void SendKill() noexcept;
	void FinishTerminate() noexcept;

	void SetTerminateError(std::string_view message) noexcept;

	void OnTerminateTimer() noexcept;
	void OnTerminated() noexcept;

	/* virtual methods from class ExitListener */
	void OnChildProcessExit(int status) noexcept override;
};
