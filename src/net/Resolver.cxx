// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Resolver.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string>

AddressInfoList
Resolve(const char *host, unsigned port, const struct addrinfo *hints)
{
	const auto service = std::to_string(port);

	struct addrinfo *ai;
	int result = getaddrinfo(host, service.c_str(), hints, &ai);
	if (result != 0)
		throw FmtRuntimeError("Failed to resolve '{}': {}",
				      host != nullptr ? host : "*",
				      gai_strerror(result));

	return AddressInfoList(ai);
}
