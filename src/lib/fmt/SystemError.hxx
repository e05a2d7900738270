// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <system_error> // IWYU pragma: export

#include <errno.h>

/**
 * Returns a #std::system_error for the given errno value.
 */
[[nodiscard]] [[gnu::cold]]
std::system_error
MakeErrno(int code, const char *msg) noexcept;

[[nodiscard]] [[gnu::cold]]
inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

[[nodiscard]] [[gnu::cold]]
std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
[[nodiscard]] [[gnu::cold]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::cold]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, args...);
}
