// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "MatchData.hxx"
#include "Options.hxx"

#include <string_view>
#include <utility>

/**
 * A compiled PCRE2 regular expression.
 */
class UniqueRegex {
	pcre2_code_8 *re = nullptr;

public:
	UniqueRegex() = default;

	/**
	 * Throws on error.
	 */
	UniqueRegex(const char *pattern, RegexOptions options) {
		Compile(pattern, options);
	}

	UniqueRegex(UniqueRegex &&src) noexcept
		:re(std::exchange(src.re, nullptr)) {}

	~UniqueRegex() noexcept {
		if (re != nullptr)
			pcre2_code_free_8(re);
	}

	UniqueRegex &operator=(UniqueRegex &&src) noexcept {
		using std::swap;
		swap(re, src.re);
		return *this;
	}

	bool IsDefined() const noexcept {
		return re != nullptr;
	}

	/**
	 * Throws std::system_error (with Pcre::error_category) on
	 * error.
	 */
	void Compile(const char *pattern, RegexOptions options);

	MatchData Match(std::string_view s) const noexcept;
};
