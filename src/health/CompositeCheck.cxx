// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CompositeCheck.hxx"

bool
CompositeHealthCheck::IsHealthy()
{
	for (const auto &i : children)
		if (!i->IsHealthy())
			return false;

	return true;
}
