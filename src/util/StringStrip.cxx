// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <algorithm>

#include <string.h>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

std::string_view
StripLeft(std::string_view s) noexcept
{
	auto i = std::find_if_not(s.begin(), s.end(),
				  [](char ch){ return IsWhitespaceOrNull(ch); });

	return s.substr(std::distance(s.begin(), i));
}

void
StripRight(char *p) noexcept
{
	std::size_t old_length = strlen(p);
	std::size_t new_length = StripRight(std::string_view{p, old_length}).size();
	p[new_length] = 0;
}

std::string_view
StripRight(std::string_view s) noexcept
{
	auto i = std::find_if_not(s.rbegin(), s.rend(),
				  [](char ch){ return IsWhitespaceOrNull(ch); });

	return s.substr(0, std::distance(i, s.rend()));
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
