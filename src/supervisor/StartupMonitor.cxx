// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StartupMonitor.hxx"
#include "SidecarProcess.hxx"
#include "ErrorClassifier.hxx"
#include "net/PortProbe.hxx"
#include "io/Logger.hxx"

#include <chrono>

StartupMonitor::StartupMonitor(EventLoop &event_loop, const Logger &_logger,
			       SidecarProcess &_process,
			       const ErrorClassifier &_classifier,
			       std::string_view _server_url,
			       unsigned _port,
			       unsigned _max_checks, Duration _delay,
			       Duration _stop_grace, Duration _kill_wait,
			       StartupMonitorHandler &_handler) noexcept
	:logger(_logger), process(_process), classifier(_classifier),
	 server_url(_server_url), port(_port),
	 max_checks(_max_checks),
	 delay(_delay), stop_grace(_stop_grace), kill_wait(_kill_wait),
	 timer(event_loop, BIND_THIS_METHOD(OnTimer)),
	 handler(_handler)
{
}

bool
StartupMonitor::IsPortBound() const noexcept
{
	try {
		return !IsPortFree(port);
	} catch (const std::invalid_argument &e) {
		logger(2, "Failed to probe port ", port, ": ", e);
		return false;
	}
}

void
StartupMonitor::Fail(std::optional<int> exit_status) noexcept
{
	StartupFailure failure;
	failure.output = process.GetCapture().Collect();
	failure.message = classifier.Classify(failure.output.stdout_text,
					      failure.output.stderr_text,
					      server_url);
	failure.exit_status = exit_status;

	handler.OnStartupFailed(std::move(failure));
}

void
StartupMonitor::OnTimer() noexcept
{
	++n_checks;

	if (!process.IsAlive()) {
		Fail(process.GetExitStatus());
		return;
	}

	if (IsPortBound()) {
		logger.Fmt(5, "Sidecar bound to port {} (check {}/{})",
			   port, n_checks, max_checks);
		process.GetCapture().Drain();
		handler.OnStartupBound();
		return;
	}

	logger.Fmt(6, "Sidecar not yet bound to port {} (check {}/{})",
		   port, n_checks, max_checks);

	process.GetCapture().Drain();

	if (n_checks < max_checks) {
		timer.Schedule(delay);
		return;
	}

	const double total = std::chrono::duration<double>(delay).count() * max_checks;
	logger.Fmt(1, "Sidecar did not bind port {}: checked {} times over {:.1f} seconds",
		   port, max_checks, total);

	process.Terminate(stop_grace, kill_wait,
			  BIND_THIS_METHOD(OnTerminated));
}

void
StartupMonitor::OnTerminated() noexcept
{
	if (auto error = process.GetTerminateError())
		logger(2, "Failed to terminate sidecar: ", error);

	Fail(std::nullopt);
}
