// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PortProcessKiller.hxx"
#include "ProcessTable.hxx"
#include "thread/Job.hxx"
#include "thread/Queue.hxx"
#include "util/Cancellable.hxx"

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

#include <errno.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

/**
 * Discovers and kills processes in a worker thread.  It deletes
 * itself after Done() has been invoked; cancellation only detaches
 * the handler, because a running job cannot be interrupted.
 */
class PortProcessKiller::Job final : public ThreadJob, Cancellable {
	const std::shared_ptr<const ProcessTable> table;

	const Logger logger;

	const unsigned port;

	/**
	 * If set, this is a zombie sweep which spares the listed
	 * processes and kills only processes matching the
	 * signature.  If not set, all listeners on the port are
	 * killed.
	 */
	const std::optional<PidSet> tracked;

	const std::string signature;

	ProcessKillerHandler *handler;

	/* the following fields are written by Run() */

	std::vector<pid_t> killed;

	std::vector<std::pair<pid_t, int>> failed;

	std::exception_ptr error;

public:
	Job(std::shared_ptr<const ProcessTable> _table,
	    const Logger &_logger, unsigned _port,
	    std::optional<PidSet> &&_tracked,
	    std::string_view _signature,
	    ProcessKillerHandler &_handler,
	    CancellablePointer &cancel_ptr) noexcept
		:table(std::move(_table)), logger(_logger), port(_port),
		 tracked(std::move(_tracked)), signature(_signature),
		 handler(&_handler)
	{
		cancel_ptr = *this;
	}

private:
	bool IsZombieSweep() const noexcept {
		return tracked.has_value();
	}

	/**
	 * Throws on error.
	 */
	std::vector<pid_t> FindZombies() const;

	/**
	 * Throws on error.
	 */
	std::vector<pid_t> FindVictims() const {
		return IsZombieSweep()
			? FindZombies()
			: table->FindListeners(port);
	}

	/* virtual methods from class ThreadJob */
	void Run() noexcept override;
	void Done() noexcept override;

	/* virtual methods from class Cancellable */
	void Cancel() noexcept override {
		handler = nullptr;
	}
};

std::vector<pid_t>
PortProcessKiller::Job::FindZombies() const
{
	const auto listeners = table->FindListeners(port);

	std::vector<pid_t> result;

	for (const auto &i : table->ListProcesses()) {
		if (tracked->contains(i.pid))
			continue;

		const bool is_listener =
			std::find(listeners.begin(), listeners.end(),
				  i.pid) != listeners.end();

		/* a process listening on the port needs to match only
		   the signature; others must also have been launched
		   for this port */
		if ((is_listener &&
		     i.command.find(signature) != i.command.npos) ||
		    MatchesLaunchSignature(i.command, signature, port))
			result.push_back(i.pid);
	}

	return result;
}

void
PortProcessKiller::Job::Run() noexcept
{
	const pid_t self = getpid();

	try {
		for (const pid_t pid : FindVictims()) {
			if (pid == self)
				continue;

			if (kill(pid, SIGKILL) == 0)
				killed.push_back(pid);
			else
				failed.emplace_back(pid, errno);
		}
	} catch (...) {
		/* reported by Done() in the main thread */
		error = std::current_exception();
	}
}

void
PortProcessKiller::Job::Done() noexcept
{
	const char *what = IsZombieSweep() ? "zombie process" : "process";

	if (error)
		logger(2, "Error finding/killing ", what, " on port ", port,
		       ": ", error);

	for (const pid_t pid : killed)
		logger.Fmt(4, "Killed {} {} on port {}", what, pid, port);

	for (const auto &[pid, e] : failed)
		logger.Fmt(2, "Failed to kill {} {} on port {}: {}",
			   what, pid, port, strerror(e));

	if (killed.empty() && failed.empty() && !error)
		logger.Fmt(5, "No {} found on port {}", what, port);

	if (handler != nullptr)
		handler->OnProcessKillerDone(!killed.empty());

	delete this;
}

PortProcessKiller::PortProcessKiller(ThreadQueue &_queue,
				     std::shared_ptr<const ProcessTable> _table,
				     std::string_view _signature) noexcept
	:queue(_queue), table(std::move(_table)), signature(_signature),
	 logger("killer")
{
}

PortProcessKiller::~PortProcessKiller() noexcept = default;

void
PortProcessKiller::KillProcessOnPort(unsigned port,
				     ProcessKillerHandler &handler,
				     CancellablePointer &cancel_ptr) noexcept
{
	logger.Fmt(5, "Checking for processes using port {}", port);

	auto *job = new Job(table, logger, port, std::nullopt, signature,
			    handler, cancel_ptr);
	queue.Add(*job);
}

void
PortProcessKiller::KillZombieProcessesForPort(unsigned port,
					      PidSet &&tracked,
					      ProcessKillerHandler &handler,
					      CancellablePointer &cancel_ptr) noexcept
{
	logger.Fmt(5, "Looking for zombie processes for port {}", port);

	auto *job = new Job(table, logger, port, std::move(tracked),
			    signature, handler, cancel_ptr);
	queue.Add(*job);
}
