// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "util/Exception.hxx"
#include "TempFile.hxx"

#include <gtest/gtest.h>

#include <limits>

using namespace std::chrono_literals;

static std::string
LoadError(const char *contents)
{
	const TempFile file{contents};
	Config config;

	try {
		LoadConfigFile(config, file.c_str());
		return {};
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		return msg.substr(file.GetPath().size());
	}
}

TEST(Config, Defaults)
{
	const Config config;
	EXPECT_EQ(config.device, "/dev/watchdog0");
	EXPECT_EQ(config.supervisor.interval, 10s);
	EXPECT_EQ(config.supervisor.startup_delay, 300s);
	EXPECT_EQ(config.supervisor.fail_timeout, 600s);
	EXPECT_FALSE(config.hardware_timeout);
	EXPECT_TRUE(config.check_memory);
	EXPECT_EQ(config.min_available_memory, 50000U);
	EXPECT_TRUE(config.check_disk_write);
	EXPECT_EQ(config.scratch_path, "/tmp/.wdt_test");
	EXPECT_EQ(config.max_write_latency, 5s);

	EXPECT_NO_THROW(config.Check());
}

TEST(Config, Load)
{
	const TempFile file{
		"# example\n"
		"[watchdog]\n"
		"device = \"/dev/watchdog1\"\n"
		"interval = 2s\n"
		"startup_delay = 1m\n"
		"fail_timeout = 90\n"
		"hardware_timeout = 30s\n"
		"\n"
		"[health]\n"
		"memory = no\n"
		"min_available_memory = 100000\n"
		"meminfo = /tmp/meminfo\n"
		"disk_write = yes\n"
		"scratch_file = '/var/tmp/wdfeed test'\n"
		"max_write_latency = 1500ms\n"
	};

	Config config;
	LoadConfigFile(config, file.c_str());

	EXPECT_EQ(config.device, "/dev/watchdog1");
	EXPECT_EQ(config.supervisor.interval, 2s);
	EXPECT_EQ(config.supervisor.startup_delay, 60s);
	EXPECT_EQ(config.supervisor.fail_timeout, 90s);
	ASSERT_TRUE(config.hardware_timeout);
	EXPECT_EQ(*config.hardware_timeout, 30s);
	EXPECT_FALSE(config.check_memory);
	EXPECT_EQ(config.min_available_memory, 100000U);
	EXPECT_EQ(config.meminfo_path, "/tmp/meminfo");
	EXPECT_TRUE(config.check_disk_write);
	EXPECT_EQ(config.scratch_path, "/var/tmp/wdfeed test");
	EXPECT_EQ(config.max_write_latency, 1500ms);

	EXPECT_NO_THROW(config.Check());
}

TEST(Config, PartialFileKeepsDefaults)
{
	const TempFile file{"[watchdog]\ninterval = 5\n"};

	Config config;
	LoadConfigFile(config, file.c_str());

	EXPECT_EQ(config.supervisor.interval, 5s);
	EXPECT_EQ(config.supervisor.fail_timeout, 600s);
	EXPECT_EQ(config.device, "/dev/watchdog0");
}

TEST(Config, Errors)
{
	EXPECT_EQ(LoadError("[foo]\n"), ":1; Unknown section: foo");
	EXPECT_EQ(LoadError("[watchdog]\nfoo = 1\n"),
		  ":2; Unknown property: foo");
	EXPECT_EQ(LoadError("[health]\ninterval = 1\n"),
		  ":2; Unknown property: interval");
	EXPECT_EQ(LoadError("[watchdog]\ninterval = 10x\n"),
		  ":2; Malformed duration: 10x; Invalid unit");
	EXPECT_EQ(LoadError("[watchdog]\nhardware_timeout = 500ms\n"),
		  ":2; Hardware timeout must be at least one second");
	EXPECT_EQ(LoadError("[health]\nmemory = maybe\n"),
		  ":2; yes/no expected");
}

TEST(Config, Check)
{
	Config config;
	config.supervisor.interval = 0s;
	EXPECT_THROW(config.Check(), std::invalid_argument);

	config = {};
	config.device.clear();
	EXPECT_THROW(config.Check(), std::invalid_argument);

	config = {};
	config.supervisor.fail_timeout = -1s;
	EXPECT_THROW(config.Check(), std::invalid_argument);

	/* zero delays are allowed */
	config = {};
	config.supervisor.startup_delay = 0s;
	config.supervisor.fail_timeout = 0s;
	EXPECT_NO_THROW(config.Check());
}

TEST(Config, HardwareTimeoutRange)
{
	const TempFile file{"[watchdog]\nhardware_timeout = 30000d\n"};

	Config config;
	LoadConfigFile(config, file.c_str());
	ASSERT_TRUE(config.hardware_timeout);
	EXPECT_THROW(config.Check(), std::invalid_argument);

	config.hardware_timeout = std::chrono::seconds{std::numeric_limits<int>::max()};
	EXPECT_NO_THROW(config.Check());

	config.hardware_timeout = std::chrono::seconds{std::numeric_limits<int>::max()} + 1s;
	EXPECT_THROW(config.Check(), std::invalid_argument);
}
