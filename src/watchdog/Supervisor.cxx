// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Supervisor.hxx"
#include "health/HealthCheck.hxx"

#include <exception>

namespace Watchdog {

void
Supervisor::Start(Event::TimePoint now) noexcept
{
	phase = Phase::STARTING;
	start_time = now;
	fail_start.reset();
	stop_logged = false;

	logger.Fmt(1, "startup delay {} seconds, feeding unconditionally",
		   Event::ToSeconds(config.startup_delay));
}

inline bool
Supervisor::CheckHealth() noexcept
{
	try {
		return health.IsHealthy();
	} catch (...) {
		logger(1, "health check failed: ", std::current_exception());
		return false;
	}
}

inline bool
Supervisor::Monitor(Event::TimePoint now) noexcept
{
	if (CheckHealth()) {
		/* a single healthy tick ends the fail window */
		fail_start.reset();
		stop_logged = false;
		return true;
	}

	if (!fail_start)
		fail_start = now;

	const auto elapsed = now - *fail_start;
	logger.Fmt(1, "unhealthy for {}/{} seconds",
		   Event::ToSeconds(elapsed),
		   Event::ToSeconds(config.fail_timeout));

	if (elapsed < config.fail_timeout)
		/* still within the grace period */
		return true;

	if (!stop_logged) {
		stop_logged = true;
		logger(1, "fail timeout exceeded, no longer feeding the watchdog");
	}

	return false;
}

bool
Supervisor::Tick(Event::TimePoint now) noexcept
{
	if (phase == Phase::STARTING) {
		if (now - start_time < config.startup_delay)
			return true;

		phase = Phase::MONITORING;
		logger.Fmt(1, "startup delay of {} seconds elapsed, monitoring health",
			   Event::ToSeconds(config.startup_delay));
	}

	return Monitor(now);
}

} // namespace Watchdog
