// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <memory>
#include <string>
#include <string_view>

enum class CaptureMode;
struct PreparedChildProcess;
class EventLoop;
class Logger;

struct CapturedOutput {
	std::string stdout_text, stderr_text;
};

/**
 * Captures the standard output and standard error of a sidecar
 * process during its startup, for diagnostics and for error
 * classification.
 */
class OutputCapture {
public:
	virtual ~OutputCapture() noexcept = default;

	/**
	 * Create the file descriptors which will become the child's
	 * stdout and stderr.
	 *
	 * Throws on error.
	 */
	virtual void Prepare(PreparedChildProcess &p) = 0;

	/**
	 * The child process has been spawned.
	 */
	virtual void Start() noexcept = 0;

	/**
	 * Read the output which is available right now (without
	 * blocking) and log it line by line.  This is a no-op if the
	 * implementation can only inspect output at the end.
	 */
	virtual void Drain() noexcept = 0;

	/**
	 * Return everything which has been captured.  Call this after
	 * the process has exited or has been terminated.
	 */
	virtual CapturedOutput Collect() noexcept = 0;

	/**
	 * The startup has succeeded; stop collecting output and
	 * release temporary resources.  Output which arrives
	 * afterwards may still be forwarded to the log.
	 */
	virtual void Detach() noexcept = 0;
};

/**
 * @param tag a string identifying the sidecar (e.g. the tenant id)
 * which may be used to name temporary files
 */
std::unique_ptr<OutputCapture>
CreateOutputCapture(CaptureMode mode, EventLoop &event_loop,
		    const Logger &logger, std::string_view tag);
