// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "PipeEvent.hxx"
#include "util/BindMethod.hxx"

#include <cassert>

#include <signal.h>

/**
 * Listen for signals delivered to this process, and then invoke a
 * callback.  The signals are blocked and received through a
 * signalfd, so the callback runs inside the #EventLoop and not in
 * asynchronous signal context; it may do anything a regular event
 * callback may do.
 *
 * After constructing an instance, call Add() to add signals to listen
 * on.  When done, call Enable().  After that, Add() must not be
 * called again.
 */
class SignalEvent {
	PipeEvent event;

	sigset_t mask;

	using Callback = BoundMethod<void(int) noexcept>;
	const Callback callback;

public:
	SignalEvent(EventLoop &loop, Callback _callback) noexcept;

	~SignalEvent() noexcept {
		Disable();
	}

	SignalEvent(const SignalEvent &) = delete;
	SignalEvent &operator=(const SignalEvent &) = delete;

	auto &GetEventLoop() const noexcept {
		return event.GetEventLoop();
	}

	bool IsDefined() const noexcept {
		return event.IsDefined();
	}

	void Add(int signo) noexcept {
		assert(!IsDefined());

		sigaddset(&mask, signo);
	}

	/**
	 * Block the signals and start listening.
	 *
	 * Throws on error.
	 */
	void Enable();

	/**
	 * Stop listening and unblock the signals.
	 */
	void Disable() noexcept;

private:
	void EventCallback(unsigned events) noexcept;
};
