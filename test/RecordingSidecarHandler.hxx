// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "supervisor/Handler.hxx"
#include "event/Loop.hxx"
#include "event/TimerEvent.hxx"
#include "util/Cancellable.hxx"
#include "util/Exception.hxx"

#include <chrono>
#include <exception>
#include <optional>
#include <string>

/**
 * Records the completion of a #Supervisor operation and breaks the
 * event loop.
 */
class RecordingSidecarHandler final
	: public SidecarStartHandler, public SidecarStopHandler,
	  public PortArbitrationHandler {
	EventLoop &event_loop;

	TimerEvent timeout;

public:
	CancellablePointer cancel_ptr;

	std::optional<unsigned> port;

	std::exception_ptr error;

	bool stopped = false, available = false;

	bool done = false, timed_out = false;

	explicit RecordingSidecarHandler(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop),
		 timeout(event_loop, BIND_THIS_METHOD(OnTimeout)) {}

	/**
	 * Run the event loop until a handler method has been invoked
	 * or the time limit has expired.
	 */
	void Wait(Event::Duration limit=std::chrono::seconds(30)) noexcept {
		if (done)
			return;

		timed_out = false;
		timeout.Schedule(limit);

		while (!done && !timed_out)
			event_loop.Run();

		timeout.Cancel();
	}

	std::string GetErrorMessage() const noexcept {
		return error ? GetFullMessage(error) : std::string{};
	}

	/* virtual methods from class SidecarStartHandler */
	void OnSidecarReady(unsigned _port) noexcept override {
		port = _port;
		Finish();
	}

	void OnSidecarError(std::exception_ptr _error) noexcept override {
		error = std::move(_error);
		Finish();
	}

	/* virtual methods from class SidecarStopHandler */
	void OnSidecarStopped() noexcept override {
		stopped = true;
		Finish();
	}

	void OnSidecarStopError(std::exception_ptr _error) noexcept override {
		error = std::move(_error);
		Finish();
	}

	/* virtual methods from class PortArbitrationHandler */
	void OnPortAvailable() noexcept override {
		available = true;
		Finish();
	}

	void OnPortUnavailable(std::exception_ptr _error) noexcept override {
		error = std::move(_error);
		Finish();
	}

private:
	void Finish() noexcept {
		done = true;
		event_loop.Break();
	}

	void OnTimeout() noexcept {
		timed_out = true;
		event_loop.Break();
	}
};

/**
 * Rethrow the exception and check whether it has the given type.
 */
template<typename T>
bool
IsErrorType(std::exception_ptr ep) noexcept
{
	return FindNested<T>(ep) != nullptr;
}
