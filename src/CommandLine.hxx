// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "event/Chrono.hxx"

#include <optional>

struct Config;

struct CommandLine {
	const char *config_path = nullptr;

	const char *device = nullptr;

	std::optional<Event::Duration> interval, startup_delay, fail_timeout;

	unsigned verbose = 1;

	bool no_health_check = false;

	bool help = false;

	/**
	 * Copy the settings from the command line to the #Config,
	 * overriding values loaded from the configuration file.
	 */
	void ApplyTo(Config &config) const noexcept;
};

/**
 * Throws on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);

void
PrintUsage(const char *argv0) noexcept;
