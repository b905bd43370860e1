// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Loop.hxx"
#include "system/Error.hxx"

#include <array>
#include <cassert>

#include <sys/epoll.h>

EventLoop::EventLoop()
	:epoll_fd(::epoll_create1(EPOLL_CLOEXEC))
{
	if (!epoll_fd.IsDefined())
		throw MakeErrno("epoll_create1() failed");
}

EventLoop::~EventLoop() noexcept
{
	assert(timers.empty());
	assert(ready_events.empty());
	assert(n_registered == 0);
}

bool
EventLoop::AddFD(int fd, unsigned events, PipeEvent &event) noexcept
{
	assert(events != 0);

	struct epoll_event e{};
	e.events = events;
	e.data.ptr = &event;
	if (epoll_ctl(epoll_fd.Get(), EPOLL_CTL_ADD, fd, &e) < 0)
		return false;

	++n_registered;
	return true;
}

bool
EventLoop::ModifyFD(int fd, unsigned events, PipeEvent &event) noexcept
{
	assert(events != 0);

	struct epoll_event e{};
	e.events = events;
	e.data.ptr = &event;
	return epoll_ctl(epoll_fd.Get(), EPOLL_CTL_MOD, fd, &e) == 0;
}

bool
EventLoop::RemoveFD(int fd, PipeEvent &event) noexcept
{
	assert(n_registered > 0);

	if (event.is_linked())
		event.unlink();

	--n_registered;
	return epoll_ctl(epoll_fd.Get(), EPOLL_CTL_DEL, fd, nullptr) == 0;
}

void
EventLoop::Insert(TimerEvent &t) noexcept
{
	timers.insert(t);
}

inline Event::Duration
EventLoop::HandleTimers() noexcept
{
	const auto now = SteadyNow();

	while (!timers.empty()) {
		auto &t = *timers.begin();
		const auto timeout = t.GetDue() - now;
		if (timeout > timeout.zero())
			return timeout;

		timers.erase(timers.begin());
		t.Run();

		if (quit)
			break;
	}

	return Event::Duration(-1);
}

template<class ToDuration, class Rep, class Period>
static constexpr ToDuration
duration_cast_round_up(std::chrono::duration<Rep, Period> d) noexcept
{
	using FromDuration = decltype(d);
	constexpr auto one = std::chrono::duration_cast<FromDuration>(ToDuration(1));
	constexpr auto round_add = one > one.zero()
		? one - FromDuration(1)
		: one.zero();
	return std::chrono::duration_cast<ToDuration>(d + round_add);
}

/**
 * Convert the given timeout specification to a milliseconds integer,
 * to be used by epoll_wait().  Any negative value (= never times out)
 * is translated to the magic value -1.
 */
static constexpr int
ExportTimeoutMS(Event::Duration timeout) noexcept
{
	return timeout >= timeout.zero()
		? int(duration_cast_round_up<std::chrono::milliseconds>(timeout).count())
		: -1;
}

inline void
EventLoop::Wait(Event::Duration timeout) noexcept
{
	std::array<struct epoll_event, 16> received_events;
	int ret = epoll_wait(epoll_fd.Get(), received_events.data(),
			     received_events.size(),
			     ExportTimeoutMS(timeout));

	/* a negative return value is EINTR; just check the timers
	   again */
	for (int i = 0; i < ret; ++i) {
		const auto &e = received_events[i];
		auto &event = *static_cast<PipeEvent *>(e.data.ptr);
		event.SetReadyFlags(e.events);

		if (!event.is_linked())
			ready_events.push_back(event);
	}
}

void
EventLoop::Run() noexcept
{
	FlushClockCaches();

	quit = false;

	do {
		/* invoke timers */

		const auto timeout = HandleTimers();
		if (quit)
			break;

		/* wait for new event */

		if (IsEmpty())
			return;

		if (ready_events.empty()) {
			Wait(timeout);
			FlushClockCaches();
		}

		/* invoke file descriptor events */
		while (!ready_events.empty() && !quit) {
			auto &event = ready_events.front();
			ready_events.pop_front();
			event.Dispatch();
		}
	} while (!quit);
}
