// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "OutputCapture.hxx"
#include "event/TimerEvent.hxx"

#include <optional>
#include <string>
#include <string_view>

class Logger;
class SidecarProcess;
class ErrorClassifier;

/**
 * Describes why a sidecar has failed to start.
 */
struct StartupFailure {
	CapturedOutput output;

	/**
	 * The classified error message.
	 */
	std::string message;

	/**
	 * The raw waitpid() status if the process has exited by
	 * itself; empty if it was still running when the check budget
	 * was exhausted (and has been terminated).
	 */
	std::optional<int> exit_status;
};

class StartupMonitorHandler {
public:
	/**
	 * The port is not free anymore; the sidecar is considered
	 * running.
	 */
	virtual void OnStartupBound() noexcept = 0;

	/**
	 * The process has exited, or it has not bound the port within
	 * the check budget (and has been terminated).
	 */
	virtual void OnStartupFailed(StartupFailure &&failure) noexcept = 0;
};

/**
 * Polls a freshly launched sidecar process and its port in fixed
 * intervals until the port is bound, the process exits or the
 * check budget is exhausted.
 *
 * To cancel, destroy this object together with the process.
 */
class StartupMonitor final {
	const Logger &logger;

	SidecarProcess &process;

	const ErrorClassifier &classifier;

	/**
	 * The URL which is embedded in classified error messages.
	 */
	const std::string server_url;

	const unsigned port;

	const unsigned max_checks;

	unsigned n_checks = 0;

	const Event::Duration delay;

	const Event::Duration stop_grace, kill_wait;

	TimerEvent timer;

	StartupMonitorHandler &handler;

public:
	using Duration = Event::Duration;

	StartupMonitor(EventLoop &event_loop, const Logger &_logger,
		       SidecarProcess &_process,
		       const ErrorClassifier &_classifier,
		       std::string_view _server_url,
		       unsigned _port,
		       unsigned _max_checks, Duration _delay,
		       Duration _stop_grace, Duration _kill_wait,
		       StartupMonitorHandler &_handler) noexcept;

	StartupMonitor(const StartupMonitor &) = delete;
	StartupMonitor &operator=(const StartupMonitor &) = delete;

	/**
	 * Schedule the first check after one delay interval.
	 */
	void Start() noexcept {
		timer.Schedule(delay);
	}

private:
	/**
	 * Probe the port.  A probe error is logged and counts as
	 * "not bound".
	 */
	bool IsPortBound() const noexcept;

	void Fail(std::optional<int> exit_status) noexcept;

	void OnTimer() noexcept;
	void OnTerminated() noexcept;
};
