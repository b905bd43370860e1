// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "HealthCheck.hxx"
#include "io/Logger.hxx"

#include <cstdint>
#include <string>

/**
 * Checks the "MemAvailable" value from /proc/meminfo against a
 * configured floor.
 */
class MemoryHealthCheck final : public HealthCheck {
	const LLogger logger{"health/memory"};

	const std::string meminfo_path;

	/**
	 * The minimum amount of available memory [kB].
	 */
	const uint_least64_t min_available;

public:
	MemoryHealthCheck(std::string _meminfo_path,
			  uint_least64_t _min_available) noexcept
		:meminfo_path(std::move(_meminfo_path)),
		 min_available(_min_available) {}

	/* virtual methods from class HealthCheck */
	bool IsHealthy() override;
};
