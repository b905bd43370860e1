// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Chrono.hxx"
#include "TimerEvent.hxx"
#include "PipeEvent.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <boost/intrusive/list.hpp>
#include <boost/intrusive/set.hpp>

#include <optional>

/**
 * An event loop that polls for events on file descriptors and
 * invokes timers.  It is based on Linux epoll.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs it.
 *
 * @see PipeEvent, TimerEvent
 */
class EventLoop final
{
	UniqueFileDescriptor epoll_fd;

	struct TimerCompare {
		bool operator()(const TimerEvent &a,
				const TimerEvent &b) const noexcept {
			return a.GetDue() < b.GetDue();
		}
	};

	boost::intrusive::multiset<TimerEvent,
				   boost::intrusive::base_hook<boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
				   boost::intrusive::compare<TimerCompare>,
				   boost::intrusive::constant_time_size<false>> timers;

	/**
	 * A list of #PipeEvent instances which have a non-zero
	 * "ready_flags" field and need to be dispatched.
	 */
	boost::intrusive::list<PipeEvent,
			       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
			       boost::intrusive::constant_time_size<false>> ready_events;

	/**
	 * The number of #PipeEvent instances currently registered
	 * with epoll.
	 */
	unsigned n_registered = 0;

	bool quit;

	mutable std::optional<Event::TimePoint> steady_now;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	/**
	 * Caching wrapper for std::chrono::steady_clock::now().  The
	 * real clock is queried at most once per event loop
	 * iteration, because it is assumed that the event loop runs
	 * for a negligible duration.
	 */
	Event::TimePoint SteadyNow() const noexcept {
		if (!steady_now)
			steady_now = Event::Clock::now();
		return *steady_now;
	}

	void FlushClockCaches() noexcept {
		steady_now.reset();
	}

	/**
	 * Stop execution of this #EventLoop at the next chance.
	 */
	void Break() noexcept {
		quit = true;
	}

	bool IsEmpty() const noexcept {
		return timers.empty() && ready_events.empty() &&
			n_registered == 0;
	}

	bool AddFD(int fd, unsigned events, PipeEvent &event) noexcept;
	bool ModifyFD(int fd, unsigned events, PipeEvent &event) noexcept;
	bool RemoveFD(int fd, PipeEvent &event) noexcept;

	void Insert(TimerEvent &t) noexcept;

	/**
	 * The main function of this class.  It will loop until
	 * Break() gets called or until there are no more registered
	 * events.
	 */
	void Run() noexcept;

private:
	/**
	 * Invoke all expired #TimerEvent instances and return the
	 * duration until the next timer expires.  Returns a negative
	 * duration if there is no timeout.
	 */
	Event::Duration HandleTimers() noexcept;

	/**
	 * Call epoll_wait() and move all returned events to
	 * #ready_events.
	 */
	void Wait(Event::Duration timeout) noexcept;
};
