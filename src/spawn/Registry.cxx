// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Registry.hxx"
#include "ExitListener.hxx"

#include <string>
#include <vector>

#include <errno.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>

inline bool
ChildProcessRegistry::ComparePid::operator()(const ChildProcess &a,
					     const ChildProcess &b) const noexcept
{
	return a.pid < b.pid;
}

inline bool
ChildProcessRegistry::ComparePid::operator()(const ChildProcess &a,
					     pid_t b) const noexcept
{
	return a.pid < b;
}

inline bool
ChildProcessRegistry::ComparePid::operator()(pid_t a,
					     const ChildProcess &b) const noexcept
{
	return a < b.pid;
}

pid_t
ChildProcessRegistry::GetPid(const ChildProcess &child) noexcept
{
	return child.pid;
}

void
ChildProcessRegistry::ChildProcess::OnExit(int status) noexcept
{
	const double elapsed =
		std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

	if (WIFSIGNALED(status)) {
		unsigned level = 1;
		if (!WCOREDUMP(status) &&
		    (WTERMSIG(status) == SIGTERM || WTERMSIG(status) == SIGKILL))
			level = 4;

		logger.Fmt(level,
			   "child process '{}' (pid {}) died from signal {}{}",
			   name, pid, WTERMSIG(status),
			   WCOREDUMP(status) ? " (core dumped)" : "");
	} else if (WEXITSTATUS(status) == 0)
		logger.Fmt(5, "child process '{}' (pid {}) exited with success",
			   name, pid);
	else
		logger.Fmt(2, "child process '{}' (pid {}) exited with status {}",
			   name, pid, WEXITSTATUS(status));

	logger.Fmt(6, "stats on '{}' (pid {}): {:.3f}s elapsed",
		   name, pid, elapsed);

	if (listener != nullptr)
		listener->OnChildProcessExit(status);
}

inline void
ChildProcessRegistry::ChildProcess::KillTimeoutCallback() noexcept
{
	logger.Fmt(3, "sending SIGKILL to child process '{}' (pid {}) due to timeout",
		   name, pid);

	if (kill(pid, SIGKILL) < 0)
		logger.Fmt(1, "failed to kill child process '{}' (pid {}): {}",
			   name, pid, strerror(errno));
}

ChildProcessRegistry::ChildProcessRegistry(EventLoop &_event_loop)
	:event_loop(_event_loop),
	 logger("child"),
	 sigchld_event(event_loop, SIGCHLD, BIND_THIS_METHOD(OnSigchld)),
	 defer_event(event_loop, BIND_THIS_METHOD(OnDeferred))
{
	sigchld_event.Enable();
}

ChildProcessRegistry::~ChildProcessRegistry() noexcept
{
	sigchld_event.Disable();

	children.clear_and_dispose([this](ChildProcess *child){
		logger.Fmt(3, "killing child process '{}' (pid {})",
			   child->name, child->pid);

		kill(child->pid, SIGKILL);

		int status;
		waitpid(child->pid, &status, 0);

		delete child;
	});
}

inline ChildProcessRegistry::ChildProcess *
ChildProcessRegistry::Find(pid_t pid) noexcept
{
	auto i = children.find(pid, ComparePid());
	if (i == children.end())
		return nullptr;

	return &*i;
}

bool
ChildProcessRegistry::Contains(pid_t pid) const noexcept
{
	return children.find(pid, ComparePid()) != children.end();
}

void
ChildProcessRegistry::Add(pid_t pid, std::string_view name,
			  ExitListener *listener) noexcept
{
	logger.Fmt(5, "added child process '{}' (pid {})", name, pid);

	auto *child = new ChildProcess(event_loop, logger, pid, name, listener);
	children.insert(*child);

	defer_event.Schedule();
}

void
ChildProcessRegistry::SetExitListener(pid_t pid,
				      ExitListener *listener) noexcept
{
	auto *child = Find(pid);
	if (child != nullptr)
		child->listener = listener;
}

void
ChildProcessRegistry::Kill(pid_t pid, int signo,
			   Duration kill_timeout) noexcept
{
	auto *child = Find(pid);
	if (child == nullptr)
		return;

	logger.Fmt(5, "sending {} to child process '{}' (pid {})",
		   strsignal(signo), child->name, pid);

	child->listener = nullptr;

	if (kill(pid, signo) < 0) {
		const int e = errno;
		logger.Fmt(1, "failed to kill child process '{}' (pid {}): {}",
			   child->name, pid, strerror(e));

		if (e == ESRCH)
			/* the process is gone already; reap it as soon
			   as possible */
			defer_event.Schedule();

		return;
	}

	child->kill_timeout_event.Schedule(kill_timeout);
}

inline void
ChildProcessRegistry::Remove(ChildProcess &child) noexcept
{
	child.kill_timeout_event.Cancel();
	children.erase(children.iterator_to(child));
}

inline void
ChildProcessRegistry::OnExit(ChildProcess &child, int status) noexcept
{
	Remove(child);
	child.OnExit(status);
	delete &child;
}

bool
ChildProcessRegistry::Check(pid_t pid) noexcept
{
	auto *child = Find(pid);
	if (child == nullptr)
		return true;

	int status;
	const pid_t result = waitpid(pid, &status, WNOHANG);
	if (result == 0)
		return false;

	if (result < 0) {
		if (errno != ECHILD)
			return false;

		/* somebody else reaped it; we can't know how it
		   exited */
		status = W_EXITCODE(0xff, 0);
	}

	OnExit(*child, status);
	return true;
}

void
ChildProcessRegistry::CheckAll() noexcept
{
	/* collect the pids first, because the exit listeners may
	   modify the set */
	std::vector<pid_t> pids;
	pids.reserve(children.size());
	ForEachPid([&pids](pid_t pid){ pids.push_back(pid); });

	for (const pid_t pid : pids)
		Check(pid);
}

void
ChildProcessRegistry::OnSigchld(int) noexcept
{
	CheckAll();
}

void
ChildProcessRegistry::OnDeferred() noexcept
{
	CheckAll();
}
