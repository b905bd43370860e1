// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept;
	bool OpenReadOnly(const char *pathname) noexcept;

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 */
	bool Close() noexcept;

	ssize_t Read(std::span<std::byte> dest) const noexcept;

	ssize_t Write(std::span<const std::byte> src) const noexcept;

	/**
	 * Write the whole buffer.  Throws on error and on short
	 * write.
	 */
	void FullWrite(std::span<const std::byte> src) const;

	/**
	 * Wrapper for fdatasync().
	 */
	bool DataSync() const noexcept;

	/**
	 * Wrapper for ioctl().
	 *
	 * @return the ioctl() return value; -1 on error with errno set
	 */
	int IoControl(unsigned long request, void *arg) const noexcept;
};
