// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "AddressInfo.hxx"

/**
 * Thin wrapper for getaddrinfo() which throws on error.
 *
 * @param host the host name or a numeric address; nullptr means
 * the wildcard address
 * @param port the port number
 * @param hints getaddrinfo() hints
 */
AddressInfoList
Resolve(const char *host, unsigned port, const struct addrinfo *hints);
