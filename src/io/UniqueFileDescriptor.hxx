// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "FileDescriptor.hxx"

#include <cassert>
#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor which owns it and closes
 * it automatically in the destructor.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(const UniqueFileDescriptor &) = delete;

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&other) noexcept {
		using std::swap;
		swap(fd, other.fd);
		return *this;
	}

	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept {
		assert(!IsDefined());

		return FileDescriptor::Open(pathname, flags, mode);
	}

	bool OpenReadOnly(const char *pathname) noexcept {
		assert(!IsDefined());

		return FileDescriptor::OpenReadOnly(pathname);
	}

	bool Close() noexcept {
		return IsDefined() && FileDescriptor::Close();
	}
};
