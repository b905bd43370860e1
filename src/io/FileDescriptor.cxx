// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FileDescriptor.hxx"
#include "system/Error.hxx"

#include <stdexcept>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

bool
FileDescriptor::Open(const char *pathname, int flags, mode_t mode) noexcept
{
	fd = ::open(pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	return Open(pathname, O_RDONLY);
}

bool
FileDescriptor::Close() noexcept
{
	return ::close(Steal()) == 0;
}

ssize_t
FileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return ::read(fd, dest.data(), dest.size());
}

ssize_t
FileDescriptor::Write(std::span<const std::byte> src) const noexcept
{
	return ::write(fd, src.data(), src.size());
}

void
FileDescriptor::FullWrite(std::span<const std::byte> src) const
{
	while (!src.empty()) {
		ssize_t nbytes = Write(src);
		if (nbytes < 0)
			throw MakeErrno("Failed to write");

		if (nbytes == 0)
			throw std::runtime_error{"Short write"};

		src = src.subspan(nbytes);
	}
}

bool
FileDescriptor::DataSync() const noexcept
{
	return ::fdatasync(fd) == 0;
}

int
FileDescriptor::IoControl(unsigned long request, void *arg) const noexcept
{
	return ::ioctl(fd, request, arg);
}
