// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/SignalEvent.hxx"
#include "event/DeferEvent.hxx"
#include "event/TimerEvent.hxx"
#include "io/Logger.hxx"

#include <boost/intrusive/set.hpp>

#include <chrono>
#include <string>
#include <string_view>

#include <sys/types.h>

class ExitListener;

/**
 * Manage child processes.  Exits are detected via SIGCHLD; each
 * registered process is reaped individually with waitpid(pid), so
 * processes spawned by other code (e.g. in a worker thread) are not
 * stolen.
 */
class ChildProcessRegistry {
	class ChildProcess;

	struct ComparePid {
		[[gnu::pure]]
		bool operator()(const ChildProcess &a, const ChildProcess &b) const noexcept;

		[[gnu::pure]]
		bool operator()(const ChildProcess &a, pid_t b) const noexcept;

		[[gnu::pure]]
		bool operator()(pid_t a, const ChildProcess &b) const noexcept;
	};

	class ChildProcess final
		: public boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>>
	{
		friend class ChildProcessRegistry;

		const Logger &logger;

		const pid_t pid;

		const std::string name;

		/**
		 * The monotonic clock when this child process was started
		 * (registered in this library).
		 */
		const std::chrono::steady_clock::time_point start_time;

		ExitListener *listener;

		/**
		 * This timer is set up by Kill().  If the child process
		 * hasn't exited after a certain amount of time, we send
		 * SIGKILL.
		 */
		TimerEvent kill_timeout_event;

	public:
		ChildProcess(EventLoop &event_loop, const Logger &_logger,
			     pid_t _pid, std::string_view _name,
			     ExitListener *_listener) noexcept
			:logger(_logger), pid(_pid), name(_name),
			 start_time(std::chrono::steady_clock::now()),
			 listener(_listener),
			 kill_timeout_event(event_loop,
					    BIND_THIS_METHOD(KillTimeoutCallback)) {}

		void OnExit(int status) noexcept;

	private:
		void KillTimeoutCallback() noexcept;
	};

	using ChildSet =
		boost::intrusive::set<ChildProcess,
				      boost::intrusive::compare<ComparePid>,
				      boost::intrusive::constant_time_size<true>>;

	EventLoop &event_loop;

	const Logger logger;

	ChildSet children;

	SignalEvent sigchld_event;

	/**
	 * Schedules an immediate waitpid() run, just in case a
	 * process exited before it was registered.
	 */
	DeferEvent defer_event;

public:
	using Duration = std::chrono::steady_clock::duration;

	/**
	 * Throws on error.
	 */
	explicit ChildProcessRegistry(EventLoop &_event_loop);

	/**
	 * Sends SIGKILL to all remaining processes.
	 */
	~ChildProcessRegistry() noexcept;

	ChildProcessRegistry(const ChildProcessRegistry &) = delete;
	ChildProcessRegistry &operator=(const ChildProcessRegistry &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	bool IsEmpty() const noexcept {
		return children.empty();
	}

	std::size_t GetCount() const noexcept {
		return children.size();
	}

	[[gnu::pure]]
	bool Contains(pid_t pid) const noexcept;

	/**
	 * Register a new child process.
	 *
	 * @param listener an optional listener which will be invoked
	 * when the process exits
	 */
	void Add(pid_t pid, std::string_view name,
		 ExitListener *listener) noexcept;

	void SetExitListener(pid_t pid, ExitListener *listener) noexcept;

	/**
	 * Send a signal to the child process and forget about its
	 * listener.  If it does not exit within the given timeout,
	 * SIGKILL is sent.
	 */
	void Kill(pid_t pid, int signo, Duration kill_timeout) noexcept;

	/**
	 * Check (without blocking) whether the process has exited;
	 * if yes, its listener is invoked synchronously.
	 *
	 * @return true if the process has exited (or is not
	 * registered)
	 */
	bool Check(pid_t pid) noexcept;

	/**
	 * Invoke the given function for each registered process id.
	 */
	template<typename F>
	void ForEachPid(F &&f) const {
		for (const auto &child : children)
			f(GetPid(child));
	}

private:
	[[gnu::pure]]
	static pid_t GetPid(const ChildProcess &child) noexcept;

	ChildProcess *Find(pid_t pid) noexcept;

	void Remove(ChildProcess &child) noexcept;

	void OnExit(ChildProcess &child, int status) noexcept;

	void CheckAll() noexcept;

	void OnSigchld(int signo) noexcept;
	void OnDeferred() noexcept;
};
