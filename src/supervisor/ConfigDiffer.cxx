// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigDiffer.hxx"
#include "AuthConfig.hxx"

#include <string_view>

[[gnu::pure]]
static bool
IsOAuthRelevantField(std::string_view name) noexcept
{
	return name.starts_with("oauth_") || name == "host" || name == "port";
}

/**
 * Compare one field, treating "absent" and "empty" as the same.
 */
[[gnu::pure]]
static bool
IsFieldDifferent(const AuthConfig &a, const AuthConfig &b,
		 std::string_view name) noexcept
{
	return a.Get(name) != b.Get(name);
}

[[gnu::pure]]
static bool
HasOAuthChanged(const AuthConfig &a, const AuthConfig &b) noexcept
{
	/* check the union of both key sets */

	for (const auto &[name, value] : a.fields)
		if (IsOAuthRelevantField(name) && IsFieldDifferent(a, b, name))
			return true;

	for (const auto &[name, value] : b.fields)
		if (IsOAuthRelevantField(name) && IsFieldDifferent(a, b, name))
			return true;

	return false;
}

bool
HasAuthConfigChanged(const AuthConfig *old_config,
		     const AuthConfig *new_config) noexcept
{
	if (old_config == nullptr && new_config == nullptr)
		return false;

	if (old_config == nullptr || new_config == nullptr)
		return true;

	if (old_config->mode != new_config->mode)
		return true;

	switch (new_config->mode) {
	case AuthMode::NONE:
		break;

	case AuthMode::API_KEY:
		return IsFieldDifferent(*old_config, *new_config, "api_key");

	case AuthMode::OAUTH:
		return HasOAuthChanged(*old_config, *new_config);
	}

	return false;
}
