// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <stdio.h>

unsigned LoggerDetail::min_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::min_level = level;
}

void
LoggerDetail::Append(std::string &dest, const std::exception &e) noexcept
{
	dest.append(GetFullMessage(e));
}

void
LoggerDetail::Append(std::string &dest, const std::exception_ptr &ep) noexcept
{
	dest.append(GetFullMessage(ep));
}

void
LoggerDetail::WriteLine(unsigned, std::string_view domain,
			std::string_view msg) noexcept
{
	std::string line;
	line.reserve(domain.size() + msg.size() + 4);

	if (!domain.empty()) {
		line.push_back('[');
		line.append(domain);
		line.append("] ");
	}

	line.append(msg);
	line.push_back('\n');

	/* one fwrite() per line; stdio locks the stream, so lines
	   from worker threads do not interleave */
	fwrite(line.data(), 1, line.size(), stderr);
}
