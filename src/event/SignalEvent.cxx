// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SignalEvent.hxx"
#include "io/Logger.hxx"
#include "system/Error.hxx"

#include <span>

#include <string.h>
#include <sys/signalfd.h>

SignalEvent::SignalEvent(EventLoop &loop, Callback _callback) noexcept
	:event(loop, BIND_THIS_METHOD(EventCallback)), callback(_callback)
{
	sigemptyset(&mask);
}

void
SignalEvent::Enable()
{
	assert(!IsDefined());

	/* block the signals before creating the signalfd, so a signal
	   arriving in between is queued instead of killing us */
	if (sigprocmask(SIG_BLOCK, &mask, nullptr) < 0)
		throw MakeErrno("sigprocmask() failed");

	int fd = signalfd(-1, &mask, SFD_NONBLOCK|SFD_CLOEXEC);
	if (fd < 0) {
		const int e = errno;
		sigprocmask(SIG_UNBLOCK, &mask, nullptr);
		throw MakeErrno(e, "signalfd() failed");
	}

	event.Open(FileDescriptor{fd});
	if (!event.ScheduleRead()) {
		const int e = errno;
		Disable();
		throw MakeErrno(e, "Failed to register signalfd");
	}
}

void
SignalEvent::Disable() noexcept
{
	if (!IsDefined())
		return;

	event.Close();

	sigprocmask(SIG_UNBLOCK, &mask, nullptr);
}

void
SignalEvent::EventCallback(unsigned) noexcept
{
	struct signalfd_siginfo info;
	ssize_t nbytes = event.GetFileDescriptor().Read(std::as_writable_bytes(std::span{&info, 1}));
	if (nbytes <= 0) {
		LogFmt(1, "signal", "Failed to read from signalfd: {}",
		       nbytes < 0 ? strerror(errno) : "end of file");
		Disable();
		return;
	}

	callback(info.ssi_signo);
}
