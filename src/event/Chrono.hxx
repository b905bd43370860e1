// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <chrono>

namespace Event {

/**
 * The clock used by classes #EventLoop and #TimerEvent.  It is
 * monotonic, i.e. not affected by adjustments of the wall clock.
 */
using Clock = std::chrono::steady_clock;

using Duration = Clock::duration;
using TimePoint = Clock::time_point;

/**
 * Convert a duration to whole seconds (rounding towards zero), for
 * display purposes.
 */
constexpr auto
ToSeconds(Duration d) noexcept
{
	return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

} // namespace Event
