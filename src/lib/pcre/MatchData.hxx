// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <utility>

/**
 * Owner of a pcre2_match_data object which holds the result of a
 * successful match.
 */
class MatchData {
	friend class UniqueRegex;

	pcre2_match_data_8 *match_data = nullptr;

	explicit MatchData(pcre2_match_data_8 *_md) noexcept
		:match_data(_md) {}

public:
	MatchData() = default;

	MatchData(MatchData &&src) noexcept
		:match_data(std::exchange(src.match_data, nullptr)) {}

	~MatchData() noexcept {
		if (match_data != nullptr)
			pcre2_match_data_free_8(match_data);
	}

	MatchData &operator=(MatchData &&src) noexcept {
		using std::swap;
		swap(match_data, src.match_data);
		return *this;
	}

	constexpr operator bool() const noexcept {
		return match_data != nullptr;
	}
};
