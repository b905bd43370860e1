// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "io/linux/ProcMeminfo.hxx"
#include "TempFile.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(ProcMeminfo, ParseLine)
{
	EXPECT_EQ(ParseMeminfoLine("MemAvailable:   123456 kB"sv, "MemAvailable"sv),
		  123456U);
	EXPECT_EQ(ParseMeminfoLine("MemAvailable:0"sv, "MemAvailable"sv), 0U);
	EXPECT_EQ(ParseMeminfoLine("HugePages_Total:       0"sv, "HugePages_Total"sv),
		  0U);

	EXPECT_FALSE(ParseMeminfoLine("MemFree:   123456 kB"sv, "MemAvailable"sv));
	EXPECT_FALSE(ParseMeminfoLine("MemAvailableX:   1 kB"sv, "MemAvailable"sv));
	EXPECT_FALSE(ParseMeminfoLine("MemAvailable"sv, "MemAvailable"sv));
	EXPECT_FALSE(ParseMeminfoLine("MemAvailable:   kB"sv, "MemAvailable"sv));
	EXPECT_FALSE(ParseMeminfoLine(""sv, "MemAvailable"sv));
}

TEST(ProcMeminfo, ReadValue)
{
	const TempFile file{"MemTotal:       16314736 kB\n"
			    "MemFree:          812344 kB\n"
			    "MemAvailable:    9876543 kB\n"};

	EXPECT_EQ(ReadMeminfoValue(file.c_str(), "MemTotal"sv), 16314736U);
	EXPECT_EQ(ReadMeminfoValue(file.c_str(), "MemAvailable"sv), 9876543U);
	EXPECT_FALSE(ReadMeminfoValue(file.c_str(), "SwapTotal"sv));
}

TEST(ProcMeminfo, ReadMissingFile)
{
	EXPECT_THROW(ReadMeminfoValue("/nonexistent/meminfo", "MemAvailable"sv),
		     std::system_error);
}
