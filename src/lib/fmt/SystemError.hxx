// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <system_error>

#include <errno.h>

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtSystemError(const std::error_category &category, int code,
		fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Construct a std::system_error for the given errno value with a
 * {fmt}-formatted message; the error string from strerror() is
 * appended by std::system_error::what().
 */
template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return VFmtSystemError(std::system_category(), code, format_str,
			       fmt::make_format_args(args...));
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, args...);
}
