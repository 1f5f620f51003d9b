// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UniqueRegex.hxx"
#include "Error.hxx"

#include <fmt/core.h>

void
UniqueRegex::Compile(const char *pattern, RegexOptions options)
{
	uint32_t flags = PCRE2_NO_AUTO_CAPTURE;

	if (options.dotall)
		flags |= PCRE2_DOTALL;

	if (options.anchored)
		flags |= PCRE2_ANCHORED;

	if (options.caseless)
		flags |= PCRE2_CASELESS;

	if (options.capture)
		flags &= ~PCRE2_NO_AUTO_CAPTURE;

	int error_number;
	PCRE2_SIZE error_offset;
	pcre2_code_8 *new_re = pcre2_compile_8((PCRE2_SPTR8)pattern,
					       PCRE2_ZERO_TERMINATED, flags,
					       &error_number, &error_offset,
					       nullptr);
	if (new_re == nullptr) {
		const auto msg = fmt::format("Error in regex at offset {}",
					     error_offset);
		throw Pcre::MakeError(error_number, msg.c_str());
	}

	if (re != nullptr)
		pcre2_code_free_8(re);

	re = new_re;
}

MatchData
UniqueRegex::Match(std::string_view s) const noexcept
{
	MatchData md{pcre2_match_data_create_from_pattern_8(re, nullptr)};
	if (!md)
		return {};

	int n = pcre2_match_8(re, (PCRE2_SPTR8)s.data(), s.size(),
			      0, 0, md.match_data, nullptr);
	if (n < 0)
		/* no match (or error) */
		return {};

	return md;
}
