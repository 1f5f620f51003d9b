// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Prepared.hxx"

std::vector<const char *>
PreparedChildProcess::MakeArgv() const noexcept
{
	std::vector<const char *> argv;
	argv.reserve(args.size() + 1);

	for (const auto &i : args)
		argv.push_back(i.c_str());

	argv.push_back(nullptr);
	return argv;
}
