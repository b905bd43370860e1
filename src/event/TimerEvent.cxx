// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TimerEvent.hxx"
#include "Loop.hxx"

void
TimerEvent::Schedule(Event::Duration d) noexcept
{
	ScheduleAt(loop.SteadyNow() + d);
}

void
TimerEvent::ScheduleAt(Event::TimePoint _due) noexcept
{
	Cancel();

	due = _due;
	loop.Insert(*this);
}
