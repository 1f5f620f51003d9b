// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>
#include <vector>

struct AuthConfig;
struct SupervisorConfig;

/**
 * The endpoints a sidecar is asked to serve.
 */
struct SidecarEndpoint {
	std::string host;
	unsigned port;

	std::string primary_url;
	std::string legacy_url;
};

/**
 * Derive the legacy endpoint URL from the primary one: trailing
 * slashes are removed and "/sse" is appended.
 */
std::string
DefaultLegacyUrl(std::string_view primary_url) noexcept;

/**
 * Build the command line which launches a sidecar: the executable,
 * the configured extra arguments, the standard options and (in
 * OAuth mode) the authentication settings as "--env NAME VALUE"
 * triples.
 */
std::vector<std::string>
BuildCommandLine(const SupervisorConfig &config,
		 const SidecarEndpoint &endpoint,
		 const AuthConfig &auth);

/**
 * Return a copy of the command line which is safe to be logged: the
 * value of each "--env NAME VALUE" triple whose NAME contains
 * "secret", "key" or "token" (case-insensitive) is replaced.
 */
std::vector<std::string>
RedactCommandLine(const std::vector<std::string> &args) noexcept;

/**
 * Join the arguments with spaces.
 */
std::string
JoinCommandLine(const std::vector<std::string> &args) noexcept;
