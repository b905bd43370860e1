// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "io/config/IniParser.hxx"
#include "io/config/LineParser.hxx"
#include "time/Parser.hxx"

#include <exception>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

using std::string_view_literals::operator""sv;

void
Config::Check() const
{
	if (device.empty())
		throw std::invalid_argument{"No watchdog device configured"};

	if (supervisor.interval <= Event::Duration::zero())
		throw std::invalid_argument{"The interval must be positive"};

	if (supervisor.startup_delay < Event::Duration::zero() ||
	    supervisor.fail_timeout < Event::Duration::zero() ||
	    max_write_latency < Event::Duration::zero())
		throw std::invalid_argument{"Durations must not be negative"};

	if (hardware_timeout && hardware_timeout->count() <= 0)
		throw std::invalid_argument{"The hardware timeout must be positive"};

	/* WDIOC_SETTIMEOUT takes an int */
	if (hardware_timeout &&
	    hardware_timeout->count() > std::numeric_limits<int>::max())
		throw std::invalid_argument{"The hardware timeout is too large"};

	if (check_disk_write && scratch_path.empty())
		throw std::invalid_argument{"No scratch file configured"};
}

static Event::Duration
ExpectDuration(LineParser &line)
{
	const char *value = line.ExpectValueAndEnd();

	try {
		return ParseDuration(value);
	} catch (...) {
		std::throw_with_nested(LineParser::Error{std::string{"Malformed duration: "} + value});
	}
}

static std::string
ExpectString(LineParser &line)
{
	return line.ExpectValueAndEnd();
}

static bool
ExpectBool(LineParser &line)
{
	const bool value = line.NextBool();
	line.ExpectEnd();
	return value;
}

namespace {

class WatchdogSectionParser final : public IniSectionParser {
	Config &config;

public:
	explicit WatchdogSectionParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from IniSectionParser */
	void Property(std::string_view name, LineParser &value) override;
};

void
WatchdogSectionParser::Property(std::string_view name, LineParser &value)
{
	if (name == "device"sv)
		config.device = ExpectString(value);
	else if (name == "interval"sv)
		config.supervisor.interval = ExpectDuration(value);
	else if (name == "startup_delay"sv)
		config.supervisor.startup_delay = ExpectDuration(value);
	else if (name == "fail_timeout"sv)
		config.supervisor.fail_timeout = ExpectDuration(value);
	else if (name == "hardware_timeout"sv) {
		const auto timeout = ExpectDuration(value);
		if (timeout < std::chrono::seconds{1})
			throw LineParser::Error{"Hardware timeout must be at least one second"};

		config.hardware_timeout = std::chrono::duration_cast<std::chrono::seconds>(timeout);
	} else
		throw LineParser::Error{"Unknown property: " + std::string{name}};
}

class HealthSectionParser final : public IniSectionParser {
	Config &config;

public:
	explicit HealthSectionParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from IniSectionParser */
	void Property(std::string_view name, LineParser &value) override;
};

void
HealthSectionParser::Property(std::string_view name, LineParser &value)
{
	if (name == "memory"sv)
		config.check_memory = ExpectBool(value);
	else if (name == "min_available_memory"sv) {
		config.min_available_memory = value.NextPositiveInteger();
		value.ExpectEnd();
	} else if (name == "meminfo"sv)
		config.meminfo_path = ExpectString(value);
	else if (name == "disk_write"sv)
		config.check_disk_write = ExpectBool(value);
	else if (name == "scratch_file"sv)
		config.scratch_path = ExpectString(value);
	else if (name == "max_write_latency"sv)
		config.max_write_latency = ExpectDuration(value);
	else
		throw LineParser::Error{"Unknown property: " + std::string{name}};
}

class WatchdogConfigParser final : public IniFileParser {
	Config &config;

public:
	explicit WatchdogConfigParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from IniFileParser */
	std::unique_ptr<IniSectionParser> Section(std::string_view name) override {
		if (name == "watchdog"sv)
			return std::make_unique<WatchdogSectionParser>(config);
		else if (name == "health"sv)
			return std::make_unique<HealthSectionParser>(config);
		else
			return nullptr;
	}
};

} // anonymous namespace

void
LoadConfigFile(Config &config, const char *path)
{
	WatchdogConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);
}
