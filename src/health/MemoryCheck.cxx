// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "MemoryCheck.hxx"
#include "io/linux/ProcMeminfo.hxx"

using std::string_view_literals::operator""sv;

bool
MemoryHealthCheck::IsHealthy()
{
	const auto value = ReadMeminfoValue(meminfo_path.c_str(),
					    "MemAvailable"sv);
	if (!value)
		logger(1, "no MemAvailable in ", meminfo_path);

	/* a missing value counts as zero */
	const uint_least64_t available = value.value_or(0);
	if (available < min_available) {
		logger.Fmt(1, "low memory: {} kB available, need {} kB",
			   available, min_available);
		return false;
	}

	logger.Fmt(2, "{} kB available", available);
	return true;
}
