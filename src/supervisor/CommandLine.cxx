// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "AuthConfig.hxx"
#include "Config.hxx"
#include "sidecar/Protocol.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>

#include <cctype>

std::string
DefaultLegacyUrl(std::string_view primary_url) noexcept
{
	while (!primary_url.empty() && primary_url.back() == '/')
		primary_url.remove_suffix(1);

	std::string result{primary_url};
	result.append(Sidecar::LEGACY_URL_SUFFIX);
	return result;
}

/**
 * Returns the callback URL; "oauth_callback_path" is an alias if
 * "oauth_callback_url" is not set.
 */
[[gnu::pure]]
static std::string_view
GetOAuthField(const AuthConfig &auth, std::string_view name) noexcept
{
	auto value = auth.Get(name);
	if (value.empty() && name == "oauth_callback_url")
		value = auth.Get("oauth_callback_path");
	return value;
}

static void
AppendOAuthOptions(std::vector<std::string> &args, const AuthConfig &auth)
{
	using namespace Sidecar;

	args.emplace_back(OPTION_AUTH_TYPE);
	args.emplace_back(AUTH_TYPE_OAUTH);

	args.emplace_back(OPTION_ENV);
	args.emplace_back(ENV_ENABLE_OAUTH);
	args.emplace_back("True");

	for (const auto &i : OAUTH_ENV_MAPPINGS) {
		const auto value = GetOAuthField(auth, i.field);
		if (Strip(value).empty())
			continue;

		args.emplace_back(OPTION_ENV);
		args.emplace_back(i.env);
		args.emplace_back(value);
	}
}

std::vector<std::string>
BuildCommandLine(const SupervisorConfig &config,
		 const SidecarEndpoint &endpoint,
		 const AuthConfig &auth)
{
	using namespace Sidecar;

	std::vector<std::string> args;
	args.emplace_back(config.executable);
	args.insert(args.end(),
		    config.arguments.begin(), config.arguments.end());

	args.emplace_back(OPTION_PORT);
	args.emplace_back(std::to_string(endpoint.port));
	args.emplace_back(OPTION_HOST);
	args.emplace_back(endpoint.host);
	args.emplace_back(OPTION_MODE);
	args.emplace_back(MODE_HTTP);
	args.emplace_back(OPTION_ENDPOINT);
	args.emplace_back(endpoint.primary_url);
	args.emplace_back(OPTION_SSE_URL);
	args.emplace_back(endpoint.legacy_url.empty()
			  ? DefaultLegacyUrl(endpoint.primary_url)
			  : endpoint.legacy_url);

	if (auth.mode == AuthMode::OAUTH)
		AppendOAuthOptions(args, auth);

	return args;
}

[[gnu::pure]]
static bool
IsSecretName(std::string_view name) noexcept
{
	std::string lower{name};
	std::transform(lower.begin(), lower.end(), lower.begin(),
		       [](unsigned char ch){ return std::tolower(ch); });

	return lower.find("secret") != lower.npos ||
		lower.find("key") != lower.npos ||
		lower.find("token") != lower.npos;
}

std::vector<std::string>
RedactCommandLine(const std::vector<std::string> &args) noexcept
{
	std::vector<std::string> result;
	result.reserve(args.size());

	for (std::size_t i = 0; i < args.size();) {
		if (args[i] == Sidecar::OPTION_ENV && i + 2 < args.size()) {
			result.emplace_back(args[i]);
			result.emplace_back(args[i + 1]);
			result.emplace_back(IsSecretName(args[i + 1])
					    ? std::string{Sidecar::REDACTED}
					    : args[i + 2]);
			i += 3;
		} else {
			result.emplace_back(args[i]);
			++i;
		}
	}

	return result;
}

std::string
JoinCommandLine(const std::vector<std::string> &args) noexcept
{
	std::string result;

	for (const auto &i : args) {
		if (!result.empty())
			result.push_back(' ');
		result.append(i);
	}

	return result;
}
