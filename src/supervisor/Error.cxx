// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

static std::string
MakeMessage(std::string_view msg)
{
	if (msg.empty())
		return GENERIC_STARTUP_ERROR_MESSAGE;

	return std::string{msg};
}

SidecarError::SidecarError(std::string_view _tenant, std::string_view msg)
	:std::runtime_error(MakeMessage(msg)), tenant(_tenant)
{
}
