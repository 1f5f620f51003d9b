// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "OutputCapture.hxx"
#include "event/SocketEvent.hxx"
#include "io/UniqueFileDescriptor.hxx"

/**
 * An #OutputCapture implementation which reads non-blocking pipes
 * from the event loop.  Each complete line is logged as soon as it
 * arrives (lines on stderr which mention an error with level 2,
 * all others with level 5), and this continues after Detach().
 */
class PipeOutputCapture final : public OutputCapture {
	class Stream {
		const Logger &logger;

		/**
		 * "stdout" or "stderr".
		 */
		const char *const name;

		UniqueFileDescriptor fd;

		SocketEvent event;

		/**
		 * An incomplete line which is waiting for its
		 * newline character.
		 */
		std::string partial;

		/**
		 * Everything which has been received so far (up to
		 * #MAX_CAPTURE bytes).
		 */
		std::string text;

		bool collecting = true;

	public:
		Stream(EventLoop &event_loop, const Logger &_logger,
		       const char *_name) noexcept;

		Stream(const Stream &) = delete;
		Stream &operator=(const Stream &) = delete;

		/**
		 * Create the pipe and return its write end.
		 *
		 * Throws on error.
		 */
		UniqueFileDescriptor CreatePipe();

		void Start() noexcept;

		void Drain() noexcept;

		/**
		 * Log the incomplete line (if any) and return the
		 * captured text.
		 */
		std::string Collect() noexcept;

		void Detach() noexcept {
			collecting = false;
			text = {};
		}

	private:
		bool IsStderr() const noexcept;

		void Feed(std::string_view data) noexcept;
		void LogLine(std::string_view line) const noexcept;

		void OnSocketReady(unsigned events) noexcept;
	};

	Stream stdout_stream, stderr_stream;

public:
	PipeOutputCapture(EventLoop &event_loop, const Logger &logger) noexcept;

	/* virtual methods from class OutputCapture */
	void Prepare(PreparedChildProcess &p) override;
	void Start() noexcept override;
	void Drain() noexcept override;
	CapturedOutput Collect() noexcept override;
	void Detach() noexcept override;
};
