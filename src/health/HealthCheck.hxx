// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

/**
 * A probe which determines whether the system is healthy.  The
 * supervisor depends only on this interface, so alternative probes
 * can be plugged in.
 */
class HealthCheck {
public:
	virtual ~HealthCheck() noexcept = default;

	/**
	 * Run the probe.  It should bound its own blocking I/O; the
	 * caller does not enforce a timeout.
	 *
	 * May throw; the caller treats any exception as "unhealthy".
	 *
	 * @return true if the system is healthy
	 */
	virtual bool IsHealthy() = 0;
};
