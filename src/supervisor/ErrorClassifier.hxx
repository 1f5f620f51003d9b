// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "lib/pcre/UniqueRegex.hxx"

#include <array>
#include <string>
#include <string_view>

/**
 * Translates the output of a failed sidecar process into a message
 * which can be presented to users.
 */
class ErrorClassifier {
	struct Rule {
		UniqueRegex regex;

		/**
		 * A format string; "{}" is replaced with the server
		 * URL.
		 */
		const char *message;
	};

	static constexpr std::size_t N_RULES = 8;

	std::array<Rule, N_RULES> rules;

public:
	/**
	 * Throws if a pattern fails to compile.
	 */
	ErrorClassifier();

	ErrorClassifier(const ErrorClassifier &) = delete;
	ErrorClassifier &operator=(const ErrorClassifier &) = delete;

	/**
	 * Find the first rule matching (case-insensitively) the
	 * combined output and return its message.  Falls back to
	 * #GENERIC_STARTUP_ERROR_MESSAGE.
	 *
	 * @param server_url the OAuth server URL which is embedded in
	 * address related messages; if empty, the words "OAuth server
	 * URL" are used instead
	 */
	[[gnu::pure]]
	std::string Classify(std::string_view stdout_text,
			     std::string_view stderr_text,
			     std::string_view server_url={}) const noexcept;
};
