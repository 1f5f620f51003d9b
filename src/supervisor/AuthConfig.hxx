// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <map>
#include <string>
#include <string_view>

enum class AuthMode {
	NONE,
	API_KEY,
	OAUTH,
};

/**
 * Parse the name of an #AuthMode ("none", "api-key"/"apikey",
 * "oauth").
 *
 * Throws std::invalid_argument on error.
 */
AuthMode
ParseAuthMode(std::string_view s);

[[gnu::const]]
const char *
ToString(AuthMode mode) noexcept;

/**
 * Describes how a sidecar shall authenticate its callers.  Apart
 * from the mode, this is an opaque set of named string fields
 * (e.g. "oauth_host", "oauth_client_secret", "api_key").
 */
struct AuthConfig {
	AuthMode mode = AuthMode::NONE;

	std::map<std::string, std::string, std::less<>> fields;

	AuthConfig() = default;

	explicit AuthConfig(AuthMode _mode) noexcept
		:mode(_mode) {}

	/**
	 * @return a pointer to the value or nullptr if the field is
	 * absent
	 */
	[[gnu::pure]]
	const std::string *Find(std::string_view name) const noexcept;

	/**
	 * @return the value or an empty string if the field is absent
	 */
	[[gnu::pure]]
	std::string_view Get(std::string_view name) const noexcept;

	void Set(std::string_view name, std::string_view value) {
		fields.insert_or_assign(std::string{name}, std::string{value});
	}

	void Erase(std::string_view name) noexcept {
		if (auto i = fields.find(name); i != fields.end())
			fields.erase(i);
	}
};

/**
 * Check whether all fields required by the mode are present and
 * not blank.  Only #AuthMode::OAUTH has required fields.
 *
 * Throws std::invalid_argument listing the missing and the empty
 * fields.
 */
void
ValidateAuthConfig(const AuthConfig &config);

/**
 * The address the sidecar shall listen on.
 */
struct ListenAddress {
	std::string host;
	unsigned port;
};

/**
 * Determine the listen address from "oauth_host"/"oauth_port",
 * falling back to "host"/"port".  The port number is not
 * range-checked here.
 *
 * Throws std::invalid_argument if the host or the port is missing
 * or if the port is not a number.
 */
ListenAddress
GetListenAddress(const AuthConfig &config);
