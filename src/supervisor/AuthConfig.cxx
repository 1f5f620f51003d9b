// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AuthConfig.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <charconv>
#include <limits>
#include <vector>

AuthMode
ParseAuthMode(std::string_view s)
{
	if (s == "none")
		return AuthMode::NONE;
	else if (s == "api-key" || s == "apikey")
		return AuthMode::API_KEY;
	else if (s == "oauth")
		return AuthMode::OAUTH;
	else
		throw FmtInvalidArgument("Unknown authentication mode: {}", s);
}

const char *
ToString(AuthMode mode) noexcept
{
	switch (mode) {
	case AuthMode::NONE:
		return "none";

	case AuthMode::API_KEY:
		return "api-key";

	case AuthMode::OAUTH:
		return "oauth";
	}

	return "?";
}

const std::string *
AuthConfig::Find(std::string_view name) const noexcept
{
	auto i = fields.find(name);
	if (i == fields.end())
		return nullptr;

	return &i->second;
}

std::string_view
AuthConfig::Get(std::string_view name) const noexcept
{
	const auto *value = Find(name);
	if (value == nullptr)
		return {};

	return *value;
}

static constexpr const char *oauth_required_fields[] = {
	"oauth_host",
	"oauth_port",
	"oauth_server_url",
	"oauth_auth_url",
	"oauth_token_url",
	"oauth_client_id",
	"oauth_client_secret",
};

void
ValidateAuthConfig(const AuthConfig &config)
{
	if (config.mode != AuthMode::OAUTH)
		return;

	std::vector<std::string_view> missing, empty;

	for (const char *name : oauth_required_fields) {
		const auto *value = config.Find(name);
		if (value == nullptr)
			missing.emplace_back(name);
		else if (Strip(*value).empty())
			empty.emplace_back(name);
	}

	if (missing.empty() && empty.empty())
		return;

	std::vector<std::string> parts;
	if (!missing.empty())
		parts.emplace_back(fmt::format("Missing required fields: {}",
					       fmt::join(missing, ", ")));
	if (!empty.empty())
		parts.emplace_back(fmt::format("Empty required fields: {}",
					       fmt::join(empty, ", ")));

	throw FmtInvalidArgument("Invalid OAuth configuration: {}",
				 fmt::join(parts, "; "));
}

/**
 * Look up the first of two fields which has a non-empty value.
 */
[[gnu::pure]]
static std::string_view
GetWithFallback(const AuthConfig &config,
		std::string_view name, std::string_view fallback) noexcept
{
	auto value = config.Get(name);
	if (value.empty())
		value = config.Get(fallback);
	return value;
}

ListenAddress
GetListenAddress(const AuthConfig &config)
{
	const auto port_string = GetWithFallback(config, "oauth_port", "port");
	if (port_string.empty())
		throw std::invalid_argument("No OAuth port provided");

	const auto stripped = Strip(port_string);
	unsigned long value;
	const auto [ptr, ec] = std::from_chars(stripped.data(),
					       stripped.data() + stripped.size(),
					       value);
	if (stripped.empty() || ec != std::errc{} ||
	    ptr != stripped.data() + stripped.size() ||
	    value > std::numeric_limits<unsigned>::max())
		throw FmtInvalidArgument("Invalid OAuth port: {}", port_string);

	const auto host = GetWithFallback(config, "oauth_host", "host");
	if (host.empty())
		throw std::invalid_argument("No OAuth host provided");

	return {std::string{host}, unsigned(value)};
}
