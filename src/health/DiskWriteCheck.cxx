// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "DiskWriteCheck.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <span>

#include <fcntl.h>

inline void
DiskWriteHealthCheck::WriteScratchFile() const
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path.c_str(), O_WRONLY|O_CREAT|O_TRUNC, 0600))
		throw FmtErrno("Failed to create {}", path);

	static constexpr std::byte data[]{std::byte{'1'}};
	fd.FullWrite(data);

	if (!fd.DataSync())
		throw FmtErrno("Failed to sync {}", path);

	if (!fd.Close())
		throw FmtErrno("Failed to close {}", path);
}

bool
DiskWriteHealthCheck::IsHealthy()
{
	const auto start = Event::Clock::now();

	try {
		WriteScratchFile();
	} catch (const std::exception &e) {
		logger(1, "disk write failed: ", e.what());
		return false;
	}

	const auto duration = Event::Clock::now() - start;
	if (duration > max_latency) {
		logger.Fmt(1, "disk I/O stalled: writing {} took {} ms",
			   path,
			   std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
		return false;
	}

	return true;
}
