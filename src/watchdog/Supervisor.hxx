// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "event/Chrono.hxx"
#include "io/Logger.hxx"

#include <cstdint>
#include <optional>

class HealthCheck;

namespace Watchdog {

struct SupervisorConfig {
	/**
	 * The tick cadence: how often the device is fed (and the
	 * health checked).
	 */
	Event::Duration interval = std::chrono::seconds{10};

	/**
	 * For this long after startup, the device is fed
	 * unconditionally, without invoking the health check.
	 */
	Event::Duration startup_delay = std::chrono::minutes{5};

	/**
	 * If the system is unhealthy for this long without
	 * interruption, feeding stops and the hardware watchdog
	 * resets the host.
	 */
	Event::Duration fail_timeout = std::chrono::minutes{10};
};

enum class Phase : uint_least8_t {
	/**
	 * The startup grace period: feed unconditionally.
	 */
	STARTING,

	/**
	 * Feed only while the system is healthy (or has been
	 * unhealthy for less than the fail timeout).
	 */
	MONITORING,
};

/**
 * The state machine which decides on each tick whether the watchdog
 * shall be fed.  It does no I/O other than invoking the
 * #HealthCheck and logging; time is passed in by the caller, which
 * makes it independent of the event loop.
 *
 * Once feeding has stopped, it keeps returning false on every tick
 * until a healthy tick clears the fail window; it never terminates
 * the process by itself.
 */
class Supervisor {
	const LLogger logger{"supervisor"};

	const SupervisorConfig config;

	HealthCheck &health;

	Phase phase = Phase::STARTING;

	/**
	 * When did Start() get called?
	 */
	Event::TimePoint start_time;

	/**
	 * When did the current streak of failed health checks begin?
	 * Empty if the most recent check succeeded.
	 */
	std::optional<Event::TimePoint> fail_start;

	/**
	 * Has the "no longer feeding" warning been logged for the
	 * current fail window?
	 */
	bool stop_logged = false;

public:
	Supervisor(const SupervisorConfig &_config,
		   HealthCheck &_health) noexcept
		:config(_config), health(_health) {}

	Supervisor(const Supervisor &) = delete;
	Supervisor &operator=(const Supervisor &) = delete;

	const SupervisorConfig &GetConfig() const noexcept {
		return config;
	}

	Phase GetPhase() const noexcept {
		return phase;
	}

	const std::optional<Event::TimePoint> &GetFailStart() const noexcept {
		return fail_start;
	}

	/**
	 * Enter the startup grace period.
	 */
	void Start(Event::TimePoint now) noexcept;

	/**
	 * Evaluate one tick.
	 *
	 * @return true if the watchdog shall be fed
	 */
	[[nodiscard]]
	bool Tick(Event::TimePoint now) noexcept;

private:
	bool Monitor(Event::TimePoint now) noexcept;

	/**
	 * Invoke the #HealthCheck; an exception thrown by it is
	 * logged and counts as "unhealthy".
	 */
	bool CheckHealth() noexcept;
};

} // namespace Watchdog
