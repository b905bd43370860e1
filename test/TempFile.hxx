// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <stdlib.h>
#include <unistd.h>

/**
 * A temporary regular file which is deleted by the destructor.
 */
class TempFile {
	std::string path;

public:
	explicit TempFile(std::string_view contents={}) {
		char buffer[] = "/tmp/wdfeed-test-XXXXXX";
		UniqueFileDescriptor fd{mkstemp(buffer)};
		if (!fd.IsDefined())
			throw FmtErrno("Failed to create {}", buffer);

		path = buffer;

		fd.FullWrite(std::as_bytes(std::span{contents}));

		if (!fd.Close())
			throw FmtErrno("Failed to close {}", path);
	}

	~TempFile() noexcept {
		unlink(path.c_str());
	}

	TempFile(const TempFile &) = delete;
	TempFile &operator=(const TempFile &) = delete;

	const char *c_str() const noexcept {
		return path.c_str();
	}

	const std::string &GetPath() const noexcept {
		return path;
	}

	std::string Read() const {
		UniqueFileDescriptor fd;
		if (!fd.OpenReadOnly(path.c_str()))
			throw FmtErrno("Failed to open {}", path);

		std::string result;
		std::byte buffer[4096];

		while (true) {
			const auto nbytes = fd.Read(buffer);
			if (nbytes < 0)
				throw FmtErrno("Failed to read {}", path);

			if (nbytes == 0)
				break;

			result.append(reinterpret_cast<const char *>(buffer),
				      nbytes);
		}

		return result;
	}
};
