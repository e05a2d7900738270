// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/format.h>

#include <stdexcept> // IWYU pragma: export

template<typename S, typename... Args>
[[nodiscard]] [[gnu::cold]]
std::runtime_error
FmtRuntimeError(const S &format_str, Args&&... args) noexcept
{
	return std::runtime_error{fmt::vformat(format_str, fmt::make_format_args(args...))};
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::cold]]
std::invalid_argument
FmtInvalidArgument(const S &format_str, Args&&... args) noexcept
{
	return std::invalid_argument{fmt::vformat(format_str, fmt::make_format_args(args...))};
}
