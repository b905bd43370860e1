// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ProcMeminfo.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <array>
#include <charconv>
#include <span>

static constexpr bool
IsBlank(char ch) noexcept
{
	return ch == ' ' || ch == '\t';
}

std::optional<uint_least64_t>
ParseMeminfoLine(std::string_view line, std::string_view name) noexcept
{
	if (!line.starts_with(name))
		return std::nullopt;

	line.remove_prefix(name.size());
	if (line.empty() || line.front() != ':')
		return std::nullopt;

	line.remove_prefix(1);
	while (!line.empty() && IsBlank(line.front()))
		line.remove_prefix(1);

	uint_least64_t value;
	const auto [ptr, ec] = std::from_chars(line.data(),
					       line.data() + line.size(),
					       value);
	if (ec != std::errc{} || ptr == line.data())
		return std::nullopt;

	return value;
}

std::optional<uint_least64_t>
ReadMeminfoValue(const char *path, std::string_view name)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw FmtErrno("Failed to open {}", path);

	/* /proc/meminfo is about 1.5 kB */
	std::array<char, 8192> buffer;
	const auto nbytes = fd.Read(std::as_writable_bytes(std::span{buffer}));
	if (nbytes < 0)
		throw FmtErrno("Failed to read {}", path);

	std::string_view contents{buffer.data(), static_cast<std::size_t>(nbytes)};

	while (!contents.empty()) {
		const auto newline = contents.find('\n');
		const auto line = contents.substr(0, newline);

		if (const auto value = ParseMeminfoLine(line, name))
			return value;

		if (newline == contents.npos)
			break;

		contents.remove_prefix(newline + 1);
	}

	return std::nullopt;
}
