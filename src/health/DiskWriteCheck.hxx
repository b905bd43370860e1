// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "HealthCheck.hxx"
#include "event/Chrono.hxx"
#include "io/Logger.hxx"

#include <string>

/**
 * Writes a small scratch file and checks that this completes within
 * a bounded latency.  Catches a stalled or read-only file system.
 */
class DiskWriteHealthCheck final : public HealthCheck {
	const LLogger logger{"health/disk"};

	const std::string path;

	const Event::Duration max_latency;

public:
	DiskWriteHealthCheck(std::string _path,
			     Event::Duration _max_latency) noexcept
		:path(std::move(_path)), max_latency(_max_latency) {}

	/* virtual methods from class HealthCheck */
	bool IsHealthy() override;

private:
	/**
	 * Throws on error.
	 */
	void WriteScratchFile() const;
};
