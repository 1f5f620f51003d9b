// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LsofProcessTable.hxx"
#include "spawn/RunCommand.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <sys/wait.h>

std::vector<pid_t>
LsofProcessTable::FindListeners(unsigned port) const
{
	auto result = RunCommand({
			"lsof", "-nP",
			"-iTCP:" + std::to_string(port),
			"-sTCP:LISTEN",
			"-t",
		}, timeout);

	/* lsof exits with status 1 if nothing was found */
	if (!result.IsSuccess() &&
	    !(WIFEXITED(result.status) && WEXITSTATUS(result.status) == 1 &&
	      result.output.empty()))
		throw FmtRuntimeError("lsof failed with status {}", result.status);

	return ParseLsofOutput(result.output);
}

std::vector<ProcessInfo>
LsofProcessTable::ListProcesses() const
{
	auto result = RunCommand({"ps", "-axww", "-o", "pid=,command="},
				 timeout);
	if (!result.IsSuccess())
		throw FmtRuntimeError("ps failed with status {}", result.status);

	return ParsePsOutput(result.output);
}
