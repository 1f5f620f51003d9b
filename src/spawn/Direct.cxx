// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Direct.hxx"
#include "Prepared.hxx"
#include "system/Error.hxx"

#include <stdexcept>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

[[noreturn]]
static void
Exec(const char *path, const char *const*argv,
     FileDescriptor stdout_fd, FileDescriptor stderr_fd) noexcept
{
	/* this process inherited the signal dispositions of the event
	   loop; restore the defaults */
	signal(SIGPIPE, SIG_DFL);
	signal(SIGCHLD, SIG_DFL);

	sigset_t mask;
	sigemptyset(&mask);
	sigprocmask(SIG_SETMASK, &mask, nullptr);

	const int null_fd = open("/dev/null", O_RDWR|O_NOCTTY|O_CLOEXEC);
	if (null_fd >= 0 && null_fd != STDIN_FILENO) {
		dup2(null_fd, STDIN_FILENO);
	}

	if (!stdout_fd.IsDefined())
		stdout_fd = FileDescriptor(null_fd);

	if (!stderr_fd.IsDefined())
		stderr_fd = FileDescriptor(null_fd);

	if (stdout_fd.IsDefined())
		stdout_fd.CheckDuplicate(FileDescriptor(STDOUT_FILENO));

	if (stderr_fd.IsDefined())
		stderr_fd.CheckDuplicate(FileDescriptor(STDERR_FILENO));

	/* execvp() searches $PATH if there is no slash */
	execvp(path, const_cast<char *const*>(argv));

	const int e = errno;
	fprintf(stderr, "failed to execute %s: %s\n", path, strerror(e));
	_exit(EXIT_FAILURE);
}

pid_t
SpawnChildProcess(PreparedChildProcess &&params)
{
	const char *path = params.GetExecutable();
	if (path == nullptr)
		throw std::invalid_argument("No executable");

	const auto argv = params.MakeArgv();

	const pid_t pid = fork();
	if (pid < 0)
		throw MakeErrno("fork() failed");

	if (pid == 0)
		Exec(path, argv.data(),
		     params.stdout_fd, params.stderr_fd);

	/* the child has its own copies now */
	params.stdout_fd = UniqueFileDescriptor{};
	params.stderr_fd = UniqueFileDescriptor{};

	return pid;
}
