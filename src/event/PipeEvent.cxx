// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "PipeEvent.hxx"
#include "Loop.hxx"

#include <cassert>
#include <utility>

void
PipeEvent::Open(FileDescriptor _fd) noexcept
{
	assert(_fd.IsDefined());
	assert(!fd.IsDefined());
	assert(scheduled_flags == 0);

	fd = _fd;
}

void
PipeEvent::Close() noexcept
{
	if (!fd.IsDefined())
		return;

	Cancel();
	fd.Close();
}

bool
PipeEvent::Schedule(unsigned flags) noexcept
{
	if (flags == scheduled_flags)
		return true;

	assert(IsDefined());

	bool success;
	if (scheduled_flags == 0)
		success = loop.AddFD(fd.Get(), flags, *this);
	else if (flags == 0)
		success = loop.RemoveFD(fd.Get(), *this);
	else
		success = loop.ModifyFD(fd.Get(), flags, *this);

	if (success || flags == 0)
		scheduled_flags = flags;

	return success;
}

void
PipeEvent::Dispatch() noexcept
{
	const unsigned flags = std::exchange(ready_flags, 0) &
		(scheduled_flags | ERROR | HANGUP);

	if (flags != 0)
		callback(flags);
}
