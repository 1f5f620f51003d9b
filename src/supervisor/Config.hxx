// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

#include <chrono>
#include <string>
#include <vector>

/**
 * How the output of a sidecar process is captured during startup.
 */
enum class CaptureMode {
	/**
	 * Non-blocking pipes; lines are forwarded to the log as soon
	 * as they arrive.
	 */
	PIPE,

	/**
	 * Temporary files which are inspected only after the process
	 * has exited or the startup has ended.
	 */
	FILE,
};

struct SupervisorConfig {
	/**
	 * The feature gate.  If false, all operations fail with
	 * #DisabledError.
	 */
	bool enabled = true;

	std::string executable = "sidecar";

	/**
	 * Additional arguments inserted after the executable, before
	 * the standard options.
	 */
	std::vector<std::string> arguments;

	/**
	 * A string which identifies the command line of processes
	 * launched by this supervisor.  Used to detect orphans.  If
	 * empty, the base name of #executable is used.
	 */
	std::string signature;

	CaptureMode capture = CaptureMode::PIPE;

	/**
	 * Defaults for #StartOptions.
	 */
	unsigned max_retries = 3;
	unsigned startup_checks = 40;
	std::chrono::milliseconds startup_delay{2000};

	/**
	 * How long to wait after SIGTERM before sending SIGKILL?
	 */
	std::chrono::milliseconds stop_grace{2000};

	/**
	 * How long to wait for the process to exit after SIGKILL?
	 */
	std::chrono::milliseconds kill_wait{2000};

	/**
	 * How long to wait after killing the process occupying a port
	 * before probing it again?
	 */
	std::chrono::milliseconds port_release{2000};

	/**
	 * How long to wait after a zombie sweep has killed something?
	 */
	std::chrono::milliseconds zombie_grace{3000};

	/**
	 * The pause between two start attempts.
	 */
	std::chrono::milliseconds retry_cooldown{2000};

	/**
	 * The time limit for external commands used for process
	 * discovery.
	 */
	std::chrono::milliseconds command_timeout{5000};

	unsigned verbose = 3;

	[[gnu::pure]]
	std::string GetSignature() const noexcept;
};

/**
 * Load and parse the specified configuration file.  Throws on
 * error.
 */
void
LoadSupervisorConfig(SupervisorConfig &config,
		     const boost::filesystem::path &path);
