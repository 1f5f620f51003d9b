// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h>

struct PreparedChildProcess;

/**
 * Fork and execute the prepared child process.  The environment is
 * inherited from this process.
 *
 * Throws on error.
 *
 * @return the process id
 */
pid_t
SpawnChildProcess(PreparedChildProcess &&params);
