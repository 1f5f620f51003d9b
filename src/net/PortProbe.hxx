// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * The largest valid TCP port number.
 */
static constexpr unsigned MAX_TCP_PORT = 65535;

[[gnu::const]]
static constexpr bool
IsValidPort(unsigned port) noexcept
{
	return port >= 1 && port <= MAX_TCP_PORT;
}

/**
 * Check whether the given TCP port can be bound on this host.  The
 * address is tried with IPv4 and, where available, with IPv6 (the
 * IPv6 loopback address is used for "localhost" and "127.0.0.1").
 * Any IPv4 bind failure reports "not free"; on IPv6, only
 * EADDRINUSE does (other IPv6 errors mean that IPv6 is not
 * available, which is not a conflict).
 *
 * Only bind() is attempted; no listener is created, and
 * SO_REUSEADDR is not set, so a port in TIME_WAIT is reported as
 * occupied.
 *
 * A "free" result is only a snapshot; another process may bind the
 * port right afterwards.
 *
 * Throws std::invalid_argument if the port number is invalid or if
 * the host cannot be resolved.
 */
bool
IsPortFree(unsigned port, const char *host="localhost");
