// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>

class SidecarStartHandler {
public:
	/**
	 * The sidecar is running and has bound its port (or it was
	 * already running with the same configuration).
	 */
	virtual void OnSidecarReady(unsigned port) noexcept = 0;

	/**
	 * @param error a #SidecarError (or a derived class)
	 */
	virtual void OnSidecarError(std::exception_ptr error) noexcept = 0;
};

class SidecarStopHandler {
public:
	/**
	 * The sidecar has been stopped and its port has been
	 * released (or there was no sidecar).
	 */
	virtual void OnSidecarStopped() noexcept = 0;

	/**
	 * The operation was refused (e.g. #DisabledError).
	 */
	virtual void OnSidecarStopError(std::exception_ptr error) noexcept = 0;
};

class PortArbitrationHandler {
public:
	/**
	 * The port is free (or has been freed).
	 */
	virtual void OnPortAvailable() noexcept = 0;

	/**
	 * @param error a #ConfigurationError or a
	 * #PortConflictError
	 */
	virtual void OnPortUnavailable(std::exception_ptr error) noexcept = 0;
};
