// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/FileDescriptor.hxx"
#include "util/BindMethod.hxx"

#include <boost/intrusive/list_hook.hpp>

#include <utility>

#include <sys/epoll.h>

class EventLoop;

/**
 * Monitor events on a (non-socket) file descriptor, e.g. a pipe or a
 * signalfd.  Call Schedule() to announce events you're interested
 * in, or Cancel() to cancel your subscription.  The #EventLoop will
 * invoke the callback as soon as any of the subscribed events are
 * ready.
 *
 * This class does not feel responsible for closing the file
 * descriptor.  Call Close() to do it manually.
 */
class PipeEvent final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void(unsigned events) noexcept>;
	const Callback callback;

	FileDescriptor fd;

	/**
	 * A bit mask of events that are currently registered in the
	 * #EventLoop.
	 */
	unsigned scheduled_flags = 0;

	/**
	 * A bit mask of events which have been reported as "ready" by
	 * epoll_wait().
	 */
	unsigned ready_flags = 0;

public:
	static constexpr unsigned READ = EPOLLIN;
	static constexpr unsigned ERROR = EPOLLERR;
	static constexpr unsigned HANGUP = EPOLLHUP;

	PipeEvent(EventLoop &_loop, Callback _callback,
		  FileDescriptor _fd=FileDescriptor::Undefined()) noexcept
		:loop(_loop), callback(_callback), fd(_fd) {}

	~PipeEvent() noexcept {
		Cancel();
	}

	PipeEvent(const PipeEvent &) = delete;
	PipeEvent &operator=(const PipeEvent &) = delete;

	auto &GetEventLoop() const noexcept {
		return loop;
	}

	bool IsDefined() const noexcept {
		return fd.IsDefined();
	}

	FileDescriptor GetFileDescriptor() const noexcept {
		return fd;
	}

	void Open(FileDescriptor _fd) noexcept;

	/**
	 * Close the file descriptor (and cancel all scheduled
	 * events).
	 */
	void Close() noexcept;

	/**
	 * @return true on success, false on error (with errno set)
	 */
	bool Schedule(unsigned flags) noexcept;

	void Cancel() noexcept {
		Schedule(0);
	}

	bool ScheduleRead() noexcept {
		return Schedule(scheduled_flags | READ);
	}

private:
	void SetReadyFlags(unsigned flags) noexcept {
		ready_flags = flags;
	}

	/**
	 * Dispatch the events that were passed to SetReadyFlags().
	 */
	void Dispatch() noexcept;
};
