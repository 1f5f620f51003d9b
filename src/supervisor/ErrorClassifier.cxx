// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ErrorClassifier.hxx"
#include "Error.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <iterator>

static constexpr struct {
	const char *pattern;
	const char *message;
} error_rules[] = {
	{
		"address already in use",
		"Address {} is already in use.",
	},
	{
		"permission denied",
		"Permission denied starting Sidecar on address {}.",
	},
	{
		"connection refused",
		"Connection refused on address {}. The address may be blocked or unavailable.",
	},
	{
		"bind.*failed",
		"Failed to bind to address {}. The address may be in use or unavailable.",
	},
	{
		"timeout",
		"Sidecar startup timed out. Please try again.",
	},
	{
		"invalid.*configuration",
		"Invalid Sidecar configuration. Please check your settings.",
	},
	{
		"oauth.*error",
		"OAuth configuration error. Please check your OAuth settings.",
	},
	{
		"authentication.*failed",
		"Authentication failed. Please check your credentials.",
	},
};

static_assert(std::size(error_rules) == 8);

ErrorClassifier::ErrorClassifier()
{
	RegexOptions options;
	options.caseless = true;
	/* a match must not span lines */
	options.dotall = false;

	for (std::size_t i = 0; i < N_RULES; ++i) {
		rules[i].regex.Compile(error_rules[i].pattern, options);
		rules[i].message = error_rules[i].message;
	}
}

std::string
ErrorClassifier::Classify(std::string_view stdout_text,
			  std::string_view stderr_text,
			  std::string_view server_url) const noexcept
{
	std::string combined;
	combined.reserve(stderr_text.size() + 1 + stdout_text.size());
	combined.append(stderr_text);
	combined.push_back('\n');
	combined.append(stdout_text);

	const auto output = Strip(std::string_view{combined});

	if (server_url.empty())
		server_url = "OAuth server URL";

	for (const auto &rule : rules)
		if (rule.regex.Match(output))
			return fmt::format(fmt::runtime(rule.message), server_url);

	return GENERIC_STARTUP_ERROR_MESSAGE;
}
