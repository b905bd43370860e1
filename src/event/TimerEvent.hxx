// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Chrono.hxx"
#include "util/BindMethod.hxx"

#include <boost/intrusive/set_hook.hpp>

class EventLoop;

/**
 * Invoke an event callback after a certain amount of time.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs the #EventLoop.
 */
class TimerEvent final
	: public boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

	/**
	 * When is this timer due?  This is only valid if IsPending()
	 * returns true.
	 */
	Event::TimePoint due;

public:
	TimerEvent(EventLoop &_loop, Callback _callback) noexcept
		:loop(_loop), callback(_callback) {}

	TimerEvent(const TimerEvent &) = delete;
	TimerEvent &operator=(const TimerEvent &) = delete;

	auto &GetEventLoop() const noexcept {
		return loop;
	}

	bool IsPending() const noexcept {
		return is_linked();
	}

	Event::TimePoint GetDue() const noexcept {
		return due;
	}

	/**
	 * Schedule the timer relative to EventLoop::SteadyNow().  If
	 * it is already pending, it is rescheduled.
	 */
	void Schedule(Event::Duration d) noexcept;

	/**
	 * Schedule the timer at the given absolute time point.
	 */
	void ScheduleAt(Event::TimePoint _due) noexcept;

	void Cancel() noexcept {
		if (IsPending())
			unlink();
	}

private:
	void Run() noexcept {
		callback();
	}
};
