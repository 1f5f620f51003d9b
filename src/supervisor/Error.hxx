// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * The message used when a startup failure cannot be explained any
 * better.
 */
constexpr const char *GENERIC_STARTUP_ERROR_MESSAGE =
	"Sidecar startup failed. Check OAuth configuration and check logs for more information.";

/**
 * Base class for all errors reported by the #Supervisor.  It carries
 * the id of the tenant it refers to (may be empty).
 */
class SidecarError : public std::runtime_error {
	std::string tenant;

public:
	/**
	 * @param msg the message; if empty,
	 * #GENERIC_STARTUP_ERROR_MESSAGE is used
	 */
	SidecarError(std::string_view _tenant, std::string_view msg);

	const std::string &GetTenant() const noexcept {
		return tenant;
	}
};

/**
 * The tenant configuration is incomplete or invalid.  This error is
 * never retried.
 */
class ConfigurationError : public SidecarError {
public:
	using SidecarError::SidecarError;
};

/**
 * The requested port is occupied by another tenant or by a foreign
 * process.  This error is never retried.
 */
class PortConflictError : public SidecarError {
public:
	using SidecarError::SidecarError;
};

/**
 * The sidecar process has exited before binding its port, or it has
 * not bound it within the check budget.
 */
class StartupError : public SidecarError {
public:
	using SidecarError::SidecarError;
};

/**
 * Signalling the sidecar process for termination has failed.  This
 * error is only logged.
 */
class TeardownError : public SidecarError {
public:
	using SidecarError::SidecarError;
};

/**
 * The sidecar subsystem is disabled in the configuration.
 */
class DisabledError : public SidecarError {
public:
	explicit DisabledError(std::string_view _tenant)
		:SidecarError(_tenant, "Sidecar support is disabled in settings") {}
};

/**
 * This start operation was cancelled by a newer start request for
 * the same tenant.
 */
class SupersededError : public SidecarError {
public:
	explicit SupersededError(std::string_view _tenant)
		:SidecarError(_tenant, "Start operation superseded by a newer request") {}
};
