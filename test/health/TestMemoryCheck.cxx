// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "health/MemoryCheck.hxx"
#include "TempFile.hxx"

#include <gtest/gtest.h>

#include <system_error>

static constexpr const char *meminfo_template =
	"MemTotal:       16314736 kB\n"
	"MemFree:          812344 kB\n"
	"MemAvailable:   %s kB\n"
	"Buffers:          262064 kB\n";

static std::string
MakeMeminfo(const char *available)
{
	char buffer[512];
	snprintf(buffer, sizeof(buffer), meminfo_template, available);
	return buffer;
}

TEST(MemoryHealthCheck, Plenty)
{
	const TempFile file{MakeMeminfo("8123456")};
	MemoryHealthCheck check{file.GetPath(), 50000};
	EXPECT_TRUE(check.IsHealthy());
}

TEST(MemoryHealthCheck, Floor)
{
	const TempFile file{MakeMeminfo("50000")};
	EXPECT_TRUE(MemoryHealthCheck(file.GetPath(), 50000).IsHealthy());
	EXPECT_FALSE(MemoryHealthCheck(file.GetPath(), 50001).IsHealthy());
}

TEST(MemoryHealthCheck, Low)
{
	const TempFile file{MakeMeminfo("49999")};
	MemoryHealthCheck check{file.GetPath(), 50000};
	EXPECT_FALSE(check.IsHealthy());
}

TEST(MemoryHealthCheck, MissingField)
{
	const TempFile file{"MemTotal:       16314736 kB\n"
			    "MemFree:          812344 kB\n"};
	MemoryHealthCheck check{file.GetPath(), 50000};
	EXPECT_FALSE(check.IsHealthy());
}

TEST(MemoryHealthCheck, MissingFile)
{
	MemoryHealthCheck check{"/nonexistent/meminfo", 50000};
	EXPECT_THROW(check.IsHealthy(), std::system_error);
}
