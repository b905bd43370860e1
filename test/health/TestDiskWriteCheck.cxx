// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "health/DiskWriteCheck.hxx"
#include "TempFile.hxx"

#include <gtest/gtest.h>

using std::chrono::seconds;

TEST(DiskWriteHealthCheck, Writable)
{
	/* start with some unrelated contents which get truncated */
	const TempFile file{"garbage"};

	DiskWriteHealthCheck check{file.GetPath(), seconds{5}};
	EXPECT_TRUE(check.IsHealthy());
	EXPECT_EQ(file.Read(), "1");

	/* repeated checks overwrite the same file */
	EXPECT_TRUE(check.IsHealthy());
	EXPECT_EQ(file.Read(), "1");
}

TEST(DiskWriteHealthCheck, Unwritable)
{
	DiskWriteHealthCheck check{"/nonexistent/dir/file", seconds{5}};
	EXPECT_FALSE(check.IsHealthy());
}

TEST(DiskWriteHealthCheck, NotSyncable)
{
	/* /dev/null accepts writes, but fdatasync() fails with EINVAL
	   because the data never reaches a storage device */
	DiskWriteHealthCheck check{"/dev/null", seconds{5}};
	EXPECT_FALSE(check.IsHealthy());
}

TEST(DiskWriteHealthCheck, Stalled)
{
	const TempFile file;

	/* no write can be that fast */
	DiskWriteHealthCheck check{file.GetPath(), Event::Duration{-1}};
	EXPECT_FALSE(check.IsHealthy());
}
