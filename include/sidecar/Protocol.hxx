// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for the invocation contract between the supervisor
 * and the sidecar process it launches.
 */

#pragma once

namespace Sidecar {

/**
 * Command line options understood by the sidecar executable.  Each
 * one is followed by exactly one value.
 */
constexpr const char *OPTION_PORT = "--port";
constexpr const char *OPTION_HOST = "--host";
constexpr const char *OPTION_MODE = "--mode";
constexpr const char *OPTION_ENDPOINT = "--endpoint";
constexpr const char *OPTION_SSE_URL = "--sse-url";
constexpr const char *OPTION_AUTH_TYPE = "--auth_type";

/**
 * Sets an environment variable inside the sidecar; followed by two
 * values: the name and the value.
 */
constexpr const char *OPTION_ENV = "--env";

/**
 * The transport mode which is always requested.
 */
constexpr const char *MODE_HTTP = "http";

constexpr const char *AUTH_TYPE_OAUTH = "oauth";

/**
 * The suffix which is appended to the primary endpoint to obtain
 * the default legacy (server-sent events) endpoint.
 */
constexpr const char *LEGACY_URL_SUFFIX = "/sse";

constexpr const char *ENV_ENABLE_OAUTH = "ENABLE_OAUTH";

/**
 * Maps an OAuth configuration field to the environment variable
 * passed to the sidecar.
 */
struct OAuthEnvMapping {
	const char *field;
	const char *env;
};

constexpr OAuthEnvMapping OAUTH_ENV_MAPPINGS[] = {
	{"oauth_host", "OAUTH_HOST"},
	{"oauth_port", "OAUTH_PORT"},
	{"oauth_server_url", "OAUTH_SERVER_URL"},
	{"oauth_callback_url", "OAUTH_CALLBACK_URL"},
	{"oauth_client_id", "OAUTH_CLIENT_ID"},
	{"oauth_client_secret", "OAUTH_CLIENT_SECRET"},
	{"oauth_auth_url", "OAUTH_AUTH_URL"},
	{"oauth_token_url", "OAUTH_TOKEN_URL"},
	{"oauth_mcp_scope", "OAUTH_MCP_SCOPE"},
	{"oauth_provider_scope", "OAUTH_PROVIDER_SCOPE"},
};

/**
 * Replacement for secret values in logged command lines.
 */
constexpr const char *REDACTED = "***REDACTED***";

} // namespace Sidecar
