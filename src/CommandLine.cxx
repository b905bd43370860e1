// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "Config.hxx"
#include "time/Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/core.h>

#include <exception>

#include <getopt.h>
#include <stdio.h>

void
CommandLine::ApplyTo(Config &config) const noexcept
{
	if (device != nullptr)
		config.device = device;

	if (interval)
		config.supervisor.interval = *interval;

	if (startup_delay)
		config.supervisor.startup_delay = *startup_delay;

	if (fail_timeout)
		config.supervisor.fail_timeout = *fail_timeout;

	if (no_health_check) {
		config.check_memory = false;
		config.check_disk_write = false;
	}
}

void
PrintUsage(const char *argv0) noexcept
{
	fmt::print(stderr,
		   "Usage: {} [OPTIONS]\n"
		   "\n"
		   "Options:\n"
		   "  -c, --config FILE            load configuration file\n"
		   "  -d, --device PATH            watchdog device [/dev/watchdog0]\n"
		   "  -i, --interval DURATION      feed interval [10s]\n"
		   "  -s, --startup-delay DURATION feed unconditionally after startup [5m]\n"
		   "  -f, --fail-timeout DURATION  stop feeding after being unhealthy [10m]\n"
		   "  -n, --no-health-check        feed unconditionally\n"
		   "  -v, --verbose                be more verbose (repeatable)\n"
		   "  -q, --quiet                  log only fatal errors\n"
		   "  -h, --help                   show this help\n",
		   argv0);
}

static Event::Duration
ParseDurationOption(const char *option, const char *value)
{
	try {
		return ParseDuration(value);
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Malformed value for {}: {}",
						       option, value));
	}
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"config", required_argument, nullptr, 'c'},
		{"device", required_argument, nullptr, 'd'},
		{"interval", required_argument, nullptr, 'i'},
		{"startup-delay", required_argument, nullptr, 's'},
		{"fail-timeout", required_argument, nullptr, 'f'},
		{"no-health-check", no_argument, nullptr, 'n'},
		{"verbose", no_argument, nullptr, 'v'},
		{"quiet", no_argument, nullptr, 'q'},
		{"help", no_argument, nullptr, 'h'},
		{nullptr, 0, nullptr, 0},
	};

	CommandLine cmdline;

	/* restart scanning (matters if this is called repeatedly) */
	optind = 0;
	opterr = 0;

	int c;
	while ((c = getopt_long(argc, argv, ":c:d:i:s:f:nvqh",
				long_options, nullptr)) >= 0) {
		switch (c) {
		case 'c':
			cmdline.config_path = optarg;
			break;

		case 'd':
			cmdline.device = optarg;
			break;

		case 'i':
			cmdline.interval = ParseDurationOption("--interval", optarg);
			break;

		case 's':
			cmdline.startup_delay = ParseDurationOption("--startup-delay", optarg);
			break;

		case 'f':
			cmdline.fail_timeout = ParseDurationOption("--fail-timeout", optarg);
			break;

		case 'n':
			cmdline.no_health_check = true;
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case 'q':
			cmdline.verbose = 0;
			break;

		case 'h':
			cmdline.help = true;
			break;

		case ':':
			throw FmtRuntimeError("Option {} requires an argument",
					      argv[optind - 1]);

		default:
			throw FmtRuntimeError("Unknown option: {}",
					      argv[optind - 1]);
		}
	}

	if (optind < argc)
		throw FmtRuntimeError("Unexpected argument: {}", argv[optind]);

	return cmdline;
}
