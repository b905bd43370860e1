// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Parser.hxx"

#include <cstdlib> // for strtoull()
#include <cstring>
#include <limits>
#include <stdexcept>

static std::chrono::steady_clock::duration
ParseUnit(const char *s)
{
	using namespace std::chrono_literals;

	if (*s == 0 || strcmp(s, "s") == 0)
		return 1s;

	if (strcmp(s, "ms") == 0)
		return 1ms;

	if (strcmp(s, "m") == 0 || strcmp(s, "min") == 0)
		return 1min;

	if (strcmp(s, "h") == 0)
		return 1h;

	if (strcmp(s, "d") == 0)
		return 24h;

	throw std::invalid_argument{"Invalid unit"};
}

std::chrono::steady_clock::duration
ParseDuration(const char *s)
{
	/* strtoull() would silently accept a minus sign */
	if (*s < '0' || *s > '9')
		throw std::invalid_argument{"Failed to parse number"};

	char *endptr;
	const auto i = strtoull(s, &endptr, 10);
	if (endptr == s)
		throw std::invalid_argument{"Failed to parse number"};

	const auto unit = ParseUnit(endptr);

	using Rep = std::chrono::steady_clock::duration::rep;
	if (i > static_cast<unsigned long long>(std::numeric_limits<Rep>::max() / unit.count()))
		throw std::invalid_argument{"Duration is too large"};

	return static_cast<Rep>(i) * unit;
}
