// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Device.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/Logger.hxx"

#include <chrono>
#include <optional>
#include <string>

namespace Watchdog {

/**
 * Information about the watchdog driver obtained with
 * WDIOC_GETSUPPORT.
 */
struct DeviceInfo {
	std::string identity;

	/**
	 * WDIOF_* flags.
	 */
	unsigned options;

	unsigned firmware_version;

	bool HasMagicClose() const noexcept;
	bool CanSetTimeout() const noexcept;
};

/**
 * A Linux watchdog character device (e.g. /dev/watchdog0), see
 * https://docs.kernel.org/watchdog/watchdog-api.html
 *
 * Destroying an instance without calling Disarm() closes the handle
 * without the magic byte; the kernel then keeps counting down and
 * eventually resets the machine.
 */
class KernelDevice final : public Device {
	const std::string path;

	const Logger logger;

	UniqueFileDescriptor fd;

public:
	/**
	 * Open the device for writing.
	 *
	 * Throws #DeviceUnavailable on error.
	 */
	explicit KernelDevice(const char *_path);

	~KernelDevice() noexcept override;

	KernelDevice(const KernelDevice &) = delete;
	KernelDevice &operator=(const KernelDevice &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}

	/**
	 * Query the driver.  Returns std::nullopt if the file is not
	 * a watchdog device or the driver does not implement
	 * WDIOC_GETSUPPORT.
	 */
	std::optional<DeviceInfo> GetInfo() const noexcept;

	/**
	 * Query the kernel-side timeout.  Returns std::nullopt if the
	 * driver does not support WDIOC_GETTIMEOUT.
	 */
	std::optional<std::chrono::seconds> GetTimeout() const noexcept;

	/**
	 * Program the kernel-side timeout.  The driver may round it;
	 * the effective value is returned.
	 *
	 * @param timeout a positive value which fits in an int (see
	 * Config::Check())
	 *
	 * Throws #DeviceUnavailable on error.
	 */
	std::chrono::seconds SetTimeout(std::chrono::seconds timeout);

	/* virtual methods from class Device */
	void Feed() override;
	void Disarm() noexcept override;
};

} // namespace Watchdog
