// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>
#include <string>

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (line.IsEnd() || line.front() == '#')
		/* ignore empty lines and comments */
		return true;

	return child.PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
}

static std::string
ReadConfigFile(const char *path)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw FmtErrno("Failed to open {}", path);

	std::string contents;
	std::byte buffer[4096];

	while (true) {
		const auto nbytes = fd.Read(buffer);
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", path);

		if (nbytes == 0)
			break;

		contents.append(reinterpret_cast<const char *>(buffer), nbytes);
	}

	return contents;
}

void
ParseConfigFile(const char *path, ConfigParser &parser)
{
	const auto contents = ReadConfigFile(path);

	unsigned i = 1;
	for (std::size_t start = 0; start < contents.size(); ++i) {
		std::size_t end = contents.find('\n', start);
		if (end == contents.npos)
			end = contents.size();

		std::string line = contents.substr(start, end - start);
		LineParser line_parser(line.data());

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("{}:{}",
							       path, i));
		}

		start = end + 1;
	}

	parser.Finish();
}
