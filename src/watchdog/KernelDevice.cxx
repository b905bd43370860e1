// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "KernelDevice.hxx"
#include "system/Error.hxx"

#include <fmt/core.h>

#include <cassert>
#include <cstring>
#include <limits>
#include <span>

#include <fcntl.h>
#include <linux/watchdog.h>

namespace Watchdog {

/**
 * Any byte other than #MAGIC_CLOSE resets the countdown.
 */
static constexpr std::byte KEEPALIVE{'1'};

/**
 * Writing this byte before closing the device disables the watchdog
 * (if the driver supports WDIOF_MAGICCLOSE).
 */
static constexpr std::byte MAGIC_CLOSE{'V'};

template<typename S, typename... Args>
static DeviceUnavailable
FmtDeviceUnavailable(int code, const S &format_str, Args&&... args) noexcept
{
	return DeviceUnavailable{
		std::error_code(code, ErrnoCategory()),
		fmt::vformat(format_str, fmt::make_format_args(args...)),
	};
}

/**
 * Write one byte.  Returns 0 on success or an errno value.
 */
static int
WriteByte(FileDescriptor fd, const std::byte &b) noexcept
{
	const auto nbytes = fd.Write(std::span{&b, 1});
	if (nbytes < 0)
		return errno;

	return nbytes == 1 ? 0 : EIO;
}

bool
DeviceInfo::HasMagicClose() const noexcept
{
	return options & WDIOF_MAGICCLOSE;
}

bool
DeviceInfo::CanSetTimeout() const noexcept
{
	return options & WDIOF_SETTIMEOUT;
}

KernelDevice::KernelDevice(const char *_path)
	:path(_path), logger(_path)
{
	if (!fd.Open(_path, O_WRONLY))
		throw FmtDeviceUnavailable(errno, "Failed to open watchdog device {}",
					   path);
}

KernelDevice::~KernelDevice() noexcept
{
	if (fd.IsDefined())
		logger(1, "closing without disarming; the hardware watchdog stays armed");
}

std::optional<DeviceInfo>
KernelDevice::GetInfo() const noexcept
{
	assert(fd.IsDefined());

	struct watchdog_info info{};
	if (fd.IoControl(WDIOC_GETSUPPORT, &info) < 0)
		return std::nullopt;

	return DeviceInfo{
		std::string{reinterpret_cast<const char *>(info.identity),
			    strnlen(reinterpret_cast<const char *>(info.identity),
				    sizeof(info.identity))},
		info.options,
		info.firmware_version,
	};
}

std::optional<std::chrono::seconds>
KernelDevice::GetTimeout() const noexcept
{
	assert(fd.IsDefined());

	int timeout;
	if (fd.IoControl(WDIOC_GETTIMEOUT, &timeout) < 0)
		return std::nullopt;

	return std::chrono::seconds{timeout};
}

std::chrono::seconds
KernelDevice::SetTimeout(std::chrono::seconds timeout)
{
	assert(fd.IsDefined());
	assert(timeout.count() > 0);
	assert(timeout.count() <= std::numeric_limits<int>::max());

	int value = static_cast<int>(timeout.count());
	if (fd.IoControl(WDIOC_SETTIMEOUT, &value) < 0)
		throw FmtDeviceUnavailable(errno,
					   "Failed to set the timeout of {} to {} seconds",
					   path, timeout.count());

	/* the driver writes back the effective value */
	return std::chrono::seconds{value};
}

void
KernelDevice::Feed()
{
	assert(fd.IsDefined());

	if (const int e = WriteByte(fd, KEEPALIVE); e != 0)
		throw FmtDeviceUnavailable(e, "Failed to feed watchdog device {}",
					   path);

	logger(3, "fed");
}

void
KernelDevice::Disarm() noexcept
{
	assert(fd.IsDefined());

	if (const int e = WriteByte(fd, MAGIC_CLOSE); e == 0)
		logger(1, "disarmed");
	else
		logger(1, "failed to write the magic close byte: ",
		       strerror(e));

	if (!fd.Close())
		logger(1, "failed to close: ", strerror(errno));
}

} // namespace Watchdog
