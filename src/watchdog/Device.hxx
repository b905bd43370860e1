// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <system_error>

namespace Watchdog {

/**
 * The watchdog device cannot be opened or written.  This is always
 * fatal.
 */
class DeviceUnavailable : public std::system_error {
public:
	using std::system_error::system_error;
};

/**
 * Interface for the handle of a watchdog device.  The daemon owns
 * exactly one instance through a std::unique_ptr; Disarm() is called
 * on an instance which has been moved out of that pointer, so no
 * Feed() call can follow it.
 */
class Device {
public:
	virtual ~Device() noexcept = default;

	/**
	 * Reset the kernel-side countdown to reboot.
	 *
	 * Throws #DeviceUnavailable on error.
	 */
	virtual void Feed() = 0;

	/**
	 * Disable the watchdog cleanly (magic close) and close the
	 * handle.  Must be called at most once; errors are logged.
	 */
	virtual void Disarm() noexcept = 0;
};

} // namespace Watchdog
