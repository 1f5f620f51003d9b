// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RunCommand.hxx"
#include "Direct.hxx"
#include "Prepared.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "system/Error.hxx"

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

bool
CommandResult::IsSuccess() const noexcept
{
	return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

static int
WaitForExit(pid_t pid) noexcept
{
	int status;
	while (waitpid(pid, &status, 0) < 0)
		if (errno != EINTR)
			return W_EXITCODE(0xff, 0);

	return status;
}

/**
 * Wait for the process to exit, but kill it if it does not exit
 * before the deadline.
 */
static int
WaitForExit(pid_t pid,
	    std::chrono::steady_clock::time_point deadline) noexcept
{
	while (true) {
		int status;
		const pid_t result = waitpid(pid, &status, WNOHANG);
		if (result == pid)
			return status;

		if (result < 0 && errno != EINTR)
			return W_EXITCODE(0xff, 0);

		if (std::chrono::steady_clock::now() >= deadline) {
			kill(pid, SIGKILL);
			return WaitForExit(pid);
		}

		poll(nullptr, 0, 10);
	}
}

CommandResult
RunCommand(std::vector<std::string> &&args,
	   std::chrono::milliseconds timeout)
{
	UniqueFileDescriptor r, w;
	if (!UniqueFileDescriptor::CreatePipe(r, w))
		throw MakeErrno("pipe() failed");

	const std::string name = args.empty() ? std::string{} : args.front();

	PreparedChildProcess p;
	p.args = std::move(args);
	p.stdout_fd = std::move(w);

	const pid_t pid = SpawnChildProcess(std::move(p));

	CommandResult result;

	const auto deadline = std::chrono::steady_clock::now() + timeout;

	while (true) {
		const auto remaining =
			std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
		if (remaining.count() <= 0) {
			kill(pid, SIGKILL);
			WaitForExit(pid);
			throw FmtRuntimeError("Command '{}' timed out after {}ms",
					      name, timeout.count());
		}

		struct pollfd pfd{};
		pfd.fd = r.Get();
		pfd.events = POLLIN;

		int n = poll(&pfd, 1, int(remaining.count()));
		if (n < 0) {
			if (errno == EINTR)
				continue;

			const int e = errno;
			kill(pid, SIGKILL);
			WaitForExit(pid);
			throw MakeErrno(e, "poll() failed");
		}

		if (n == 0)
			continue;

		char buffer[4096];
		ssize_t nbytes = r.Read(buffer, sizeof(buffer));
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			const int e = errno;
			kill(pid, SIGKILL);
			WaitForExit(pid);
			throw MakeErrno(e, "Failed to read from pipe");
		}

		if (nbytes == 0)
			/* end of file */
			break;

		result.output.append(buffer, nbytes);
	}

	result.status = WaitForExit(pid, deadline);
	return result;
}
