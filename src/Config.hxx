// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "watchdog/Supervisor.hxx"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

struct Config {
	std::string device = "/dev/watchdog0";

	Watchdog::SupervisorConfig supervisor;

	/**
	 * If set, program this timeout into the watchdog driver at
	 * startup.
	 */
	std::optional<std::chrono::seconds> hardware_timeout;

	bool check_memory = true;

	/**
	 * The "MemAvailable" floor [kB].
	 */
	uint_least64_t min_available_memory = 50000;

	std::string meminfo_path = "/proc/meminfo";

	bool check_disk_write = true;

	std::string scratch_path = "/tmp/.wdt_test";

	Event::Duration max_write_latency = std::chrono::seconds{5};

	/**
	 * Throws if the configuration is not usable.
	 */
	void Check() const;
};

/**
 * Load the given configuration file into the #Config object,
 * overwriting the values it specifies.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const char *path);
