// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <stdexcept>

template<typename... Args>
[[nodiscard]]
std::runtime_error
FmtRuntimeError(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return std::runtime_error{fmt::format(format_str, std::forward<Args>(args)...)};
}

template<typename... Args>
[[nodiscard]]
std::invalid_argument
FmtInvalidArgument(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return std::invalid_argument{fmt::format(format_str, std::forward<Args>(args)...)};
}
