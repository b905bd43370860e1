// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <chrono>

/**
 * Parse a duration from a string, e.g. "500ms", "30s", "5m", "3h",
 * "7d".  A number without a unit is interpreted as seconds.  Negative
 * values are rejected.
 *
 * Throws std::invalid_argument on error.
 */
std::chrono::steady_clock::duration
ParseDuration(const char *s);
