// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class ExitListener {
public:
	/**
	 * The child process has exited.
	 *
	 * @param status the raw status as returned by waitpid()
	 */
	virtual void OnChildProcessExit(int status) noexcept = 0;
};
