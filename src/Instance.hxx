// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "watchdog/Supervisor.hxx"
#include "event/Loop.hxx"
#include "event/SignalEvent.hxx"
#include "event/TimerEvent.hxx"
#include "io/Logger.hxx"

#include <exception>
#include <memory>

class HealthCheck;
namespace Watchdog { class Device; }

/**
 * The running daemon: it owns the #EventLoop, feeds the watchdog
 * device on a timer as decided by the #Watchdog::Supervisor and
 * disarms the device on a shutdown signal.
 */
class Instance {
	const LLogger logger{"wdfeed"};

	EventLoop event_loop;

	/**
	 * Receives SIGTERM, SIGINT and SIGQUIT.
	 */
	SignalEvent shutdown_signal{event_loop, BIND_THIS_METHOD(OnShutdownSignal)};

	TimerEvent tick_timer{event_loop, BIND_THIS_METHOD(OnTick)};

	/**
	 * The open watchdog device.  Released (and disarmed) on
	 * shutdown; no feed can happen after that.
	 */
	std::unique_ptr<Watchdog::Device> device;

	std::unique_ptr<HealthCheck> health;

	Watchdog::Supervisor supervisor;

	/**
	 * The phase which was last reported to systemd.
	 */
	Watchdog::Phase reported_phase = Watchdog::Phase::STARTING;

	/**
	 * A fatal error which occurred inside an event callback; it
	 * is rethrown by Run().
	 */
	std::exception_ptr error;

public:
	Instance(const Watchdog::SupervisorConfig &config,
		 std::unique_ptr<Watchdog::Device> _device,
		 std::unique_ptr<HealthCheck> _health);

	~Instance() noexcept;

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;

	auto &GetEventLoop() noexcept {
		return event_loop;
	}

	const auto &GetSupervisor() const noexcept {
		return supervisor;
	}

	/**
	 * Has the device handle been given up?  This happens after
	 * disarming it on a shutdown signal, and after a fatal feed
	 * error (which leaves the hardware watchdog armed).
	 */
	bool HasReleasedDevice() const noexcept {
		return device == nullptr;
	}

	/**
	 * Run the feed loop until a shutdown signal is received.
	 *
	 * Throws if the signal handler cannot be set up or if
	 * feeding the device fails.
	 */
	void Run();

private:
	void Fail(std::exception_ptr e) noexcept;

	void OnTick() noexcept;
	void OnShutdownSignal(int signo) noexcept;
};
