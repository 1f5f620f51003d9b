// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PortProbe.hxx"
#include "Resolver.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringAPI.hxx"

#include <errno.h>
#include <string.h>
#include <sys/socket.h>
#include <netinet/in.h>

enum class BindResult {
	OK,
	IN_USE,

	/**
	 * Failed for some other reason (e.g. address family not
	 * supported).
	 */
	OTHER,
};

static BindResult
TryBind(const struct addrinfo &ai) noexcept
{
	UniqueFileDescriptor fd(socket(ai.ai_family, ai.ai_socktype,
				       ai.ai_protocol));
	if (!fd.IsDefined())
		return BindResult::OTHER;

	if (ai.ai_family == AF_INET6) {
		/* probe only the IPv6 address, not the IPv4-mapped
		   one */
		const int value = 1;
		setsockopt(fd.Get(), IPPROTO_IPV6, IPV6_V6ONLY,
			   &value, sizeof(value));
	}

	if (bind(fd.Get(), ai.ai_addr, ai.ai_addrlen) == 0)
		return BindResult::OK;

	return errno == EADDRINUSE
		? BindResult::IN_USE
		: BindResult::OTHER;
}

static AddressInfoList
ResolvePassive(const char *host, unsigned port, int family)
{
	struct addrinfo hints{};
	hints.ai_family = family;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = AI_PASSIVE;

	return Resolve(host, port, &hints);
}

[[gnu::pure]]
static bool
IsLoopbackAlias(const char *host) noexcept
{
	return StringIsEqual(host, "localhost") ||
		StringIsEqual(host, "127.0.0.1");
}

bool
IsPortFree(unsigned port, const char *host)
{
	if (!IsValidPort(port))
		throw FmtInvalidArgument("Invalid port number: {}", port);

	if (host == nullptr || *host == 0)
		throw std::invalid_argument("No host provided");

	const bool ipv6_literal = strchr(host, ':') != nullptr;

	/* IPv4 */

	if (!ipv6_literal) {
		AddressInfoList v4;
		try {
			v4 = ResolvePassive(host, port, AF_INET);
		} catch (const std::runtime_error &) {
			std::throw_with_nested(FmtInvalidArgument("Invalid host '{}'",
								  host));
		}

		for (const auto &ai : v4)
			if (TryBind(ai) != BindResult::OK)
				return false;
	}

	/* IPv6 */

	const char *host6 = IsLoopbackAlias(host) ? "::1" : host;

	AddressInfoList v6;
	try {
		v6 = ResolvePassive(host6, port, AF_INET6);
	} catch (const std::runtime_error &) {
		if (ipv6_literal)
			std::throw_with_nested(FmtInvalidArgument("Invalid host '{}'",
								  host));

		/* the host has no IPv6 address */
		return true;
	}

	for (const auto &ai : v6)
		if (TryBind(ai) == BindResult::IN_USE)
			return false;

	return true;
}
