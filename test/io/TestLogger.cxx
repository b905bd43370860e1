// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "io/Logger.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(Logger, Concat)
{
	const LLogger logger{"test"};

	testing::internal::CaptureStderr();
	logger(1, "a", 42, std::string{"b"}, uint_least64_t{7});
	EXPECT_EQ(testing::internal::GetCapturedStderr(), "[test] a42b7\n");
}

TEST(Logger, Fmt)
{
	const Logger logger{std::string{"/dev/watchdog0"}};

	testing::internal::CaptureStderr();
	logger.Fmt(1, "unhealthy for {}/{} seconds", 30, 600);
	LogFmt(1, "", "no domain");
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "[/dev/watchdog0] unhealthy for 30/600 seconds\n"
		  "no domain\n");
}

TEST(Logger, Exception)
{
	const LLogger logger{"test"};

	std::exception_ptr ep;
	try {
		try {
			throw std::runtime_error{"inner"};
		} catch (...) {
			std::throw_with_nested(std::runtime_error{"outer"});
		}
	} catch (...) {
		ep = std::current_exception();
	}

	testing::internal::CaptureStderr();
	logger(1, "failed: ", ep);
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "[test] failed: outer; inner\n");
}

TEST(Logger, Level)
{
	const LLogger logger{"test"};

	testing::internal::CaptureStderr();
	logger(2, "verbose");
	SetLogLevel(2);
	logger(2, "now visible");
	SetLogLevel(1);
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "[test] now visible\n");
}

TEST(Logger, JournalPriority)
{
	const LLogger logger{"test"};

	testing::internal::CaptureStderr();
	SetLogJournalPriority(true);
	logger(0, "fatal");
	logger(1, "notice");
	SetLogJournalPriority(false);
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "<3>[test] fatal\n"
		  "<5>[test] notice\n");
}
