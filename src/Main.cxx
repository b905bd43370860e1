// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Instance.hxx"
#include "Config.hxx"
#include "CommandLine.hxx"
#include "watchdog/KernelDevice.hxx"
#include "health/CompositeCheck.hxx"
#include "health/MemoryCheck.hxx"
#include "health/DiskWriteCheck.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <stdlib.h>

static std::unique_ptr<Watchdog::KernelDevice>
OpenDevice(const Config &config)
{
	auto device = std::make_unique<Watchdog::KernelDevice>(config.device.c_str());
	const LLogger logger{"wdfeed"};

	if (const auto info = device->GetInfo()) {
		logger.Fmt(1, "opened watchdog device {} ({}, firmware {})",
			   config.device, info->identity,
			   info->firmware_version);

		if (!info->HasMagicClose())
			logger.Fmt(1, "warning: {} does not support the magic close; it may stay armed after shutdown",
				   config.device);
	} else
		logger.Fmt(1, "opened watchdog device {}", config.device);

	if (config.hardware_timeout) {
		const auto effective = device->SetTimeout(*config.hardware_timeout);
		logger.Fmt(2, "hardware timeout set to {} seconds",
			   effective.count());
	}

	if (const auto timeout = device->GetTimeout();
	    timeout && *timeout <= config.supervisor.interval)
		logger.Fmt(1, "warning: hardware timeout ({} seconds) is not longer than the feed interval ({} seconds)",
			   timeout->count(),
			   Event::ToSeconds(config.supervisor.interval));

	return device;
}

static std::unique_ptr<HealthCheck>
MakeHealthCheck(const Config &config)
{
	auto composite = std::make_unique<CompositeHealthCheck>();

	if (config.check_memory)
		composite->Add(std::make_unique<MemoryHealthCheck>(config.meminfo_path,
								   config.min_available_memory));

	if (config.check_disk_write)
		composite->Add(std::make_unique<DiskWriteHealthCheck>(config.scratch_path,
								      config.max_write_latency));

	if (composite->empty())
		LogFmt(1, "wdfeed", "health checks disabled, feeding unconditionally");

	return composite;
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	if (cmdline.help) {
		PrintUsage(argv[0]);
		return EXIT_SUCCESS;
	}

	SetLogLevel(cmdline.verbose);

	/* systemd sets this variable if stderr is connected to the
	   journal */
	SetLogJournalPriority(getenv("JOURNAL_STREAM") != nullptr);

	Config config;
	if (cmdline.config_path != nullptr)
		LoadConfigFile(config, cmdline.config_path);

	cmdline.ApplyTo(config);
	config.Check();

	auto device = OpenDevice(config);
	auto health = MakeHealthCheck(config);

	Instance instance{config.supervisor, std::move(device), std::move(health)};
	instance.Run();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
