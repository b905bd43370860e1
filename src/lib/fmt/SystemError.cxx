// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SystemError.hxx"

#include <fmt/format.h>

std::system_error
VFmtSystemError(const std::error_category &category, int code,
		fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);

	return std::system_error(std::error_code(code, category),
				 fmt::to_string(buffer));
}
