// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx"

#include <fmt/core.h>

template<typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	const auto msg = fmt::format(format_str, std::forward<Args>(args)...);
	return MakeErrno(code, msg.c_str());
}

template<typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	const int code = errno;
	return FmtErrno(code, format_str, std::forward<Args>(args)...);
}
