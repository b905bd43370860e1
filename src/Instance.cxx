// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Instance.hxx"
#include "watchdog/Device.hxx"
#include "health/HealthCheck.hxx"

#include <signal.h>
#include <string.h>
#include <unistd.h>

#ifdef HAVE_LIBSYSTEMD
#include <systemd/sd-daemon.h>
#endif

Instance::Instance(const Watchdog::SupervisorConfig &config,
		   std::unique_ptr<Watchdog::Device> _device,
		   std::unique_ptr<HealthCheck> _health)
	:device(std::move(_device)), health(std::move(_health)),
	 supervisor(config, *health)
{
	shutdown_signal.Add(SIGTERM);
	shutdown_signal.Add(SIGINT);
	shutdown_signal.Add(SIGQUIT);
}

Instance::~Instance() noexcept = default;

void
Instance::Run()
{
	shutdown_signal.Enable();

	supervisor.Start(event_loop.SteadyNow());

#ifdef HAVE_LIBSYSTEMD
	sd_notify(0, "READY=1\nSTATUS=starting");
#endif

	/* the first tick happens right away */
	tick_timer.Schedule(Event::Duration::zero());

	event_loop.Run();

	tick_timer.Cancel();
	shutdown_signal.Disable();

	if (error)
		std::rethrow_exception(error);
}

void
Instance::Fail(std::exception_ptr e) noexcept
{
	logger(1, "fatal error: ", e);

	error = std::move(e);

	/* leave the device armed: the hardware watchdog will reset
	   the host since nobody feeds it anymore */
	device.reset();

	tick_timer.Cancel();
	shutdown_signal.Disable();
	event_loop.Break();
}

void
Instance::OnTick() noexcept
{
	if (supervisor.Tick(event_loop.SteadyNow())) {
		try {
			device->Feed();
		} catch (...) {
			Fail(std::current_exception());
			return;
		}
	}

	if (const auto phase = supervisor.GetPhase(); phase != reported_phase) {
		reported_phase = phase;

#ifdef HAVE_LIBSYSTEMD
		sd_notify(0, "STATUS=monitoring");
#endif
	}

	tick_timer.Schedule(supervisor.GetConfig().interval);
}

void
Instance::OnShutdownSignal(int signo) noexcept
{
	logger.Fmt(1, "caught signal {} ({}), shutting down (pid={})",
		   signo, strsignal(signo), getpid());

	/* restore the default disposition; a second signal kills the
	   process */
	shutdown_signal.Disable();
	tick_timer.Cancel();

#ifdef HAVE_LIBSYSTEMD
	sd_notify(0, "STOPPING=1");
#endif

	if (device) {
		const auto d = std::move(device);
		d->Disarm();
	}

	event_loop.Break();
}
