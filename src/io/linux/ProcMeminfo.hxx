// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

/**
 * Parse one line of /proc/meminfo (e.g. "MemAvailable:  123 kB").
 *
 * @return the numeric value (usually in kB) or std::nullopt if the
 * line does not describe the given field or is malformed
 */
[[gnu::pure]]
std::optional<uint_least64_t>
ParseMeminfoLine(std::string_view line, std::string_view name) noexcept;

/**
 * Read a field from a file in the /proc/meminfo format.
 *
 * Throws on I/O error.
 *
 * @param path the file path, usually "/proc/meminfo"
 * @param name the field name without the colon, e.g. "MemAvailable"
 * @return the numeric value (usually in kB) or std::nullopt if the
 * field was not found
 */
std::optional<uint_least64_t>
ReadMeminfoValue(const char *path, std::string_view name);
