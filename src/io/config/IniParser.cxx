// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "IniParser.hxx"
#include "LineParser.hxx"

#include <string>

void
IniFileParser::ParseLine(LineParser &line)
{
	if (line.SkipSymbol('[')) {
		line.Strip();

		const std::string_view name =
			line.ExpectWordAndSymbol(']',
						 "Section name expected",
						 "']' expected");
		line.ExpectEnd();

		if (child) {
			auto old = std::move(child);
			old->Finish();
		}

		child = Section(name);
		if (!child)
			throw LineParser::Error{"Unknown section: " + std::string{name}};

		return;
	}

	if (!child)
		throw LineParser::Error{"Section header expected"};

	const std::string_view name =
		line.ExpectWordAndSymbol('=',
					 "Property name expected",
					 "'=' expected");
	child->Property(name, line);
}

void
IniFileParser::Finish()
{
	if (child) {
		auto old = std::move(child);
		old->Finish();
	}

	ConfigParser::Finish();
}
