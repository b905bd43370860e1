// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ConfigParser.hxx"

#include <memory>
#include <string_view>

/**
 * Receives the properties of one INI section.
 */
class IniSectionParser {
public:
	virtual ~IniSectionParser() noexcept = default;

	/**
	 * A property was found.  Throw #LineParser::Error if the
	 * name is not known in this section or if the value is
	 * malformed.
	 *
	 * @param value a #LineParser positioned at the value
	 */
	virtual void Property(std::string_view name, LineParser &value) = 0;

	/**
	 * The section has ended.
	 */
	virtual void Finish() {}
};

/**
 * Parse INI files consisting of "[section]" headers and
 * "name = value" properties.  Every property must be inside a
 * section.
 */
class IniFileParser : public ConfigParser {
	std::unique_ptr<IniSectionParser> child;

public:
	/**
	 * A section header was found.
	 *
	 * @return a parser for the section's properties or nullptr
	 * if the section is unknown
	 */
	[[nodiscard]]
	virtual std::unique_ptr<IniSectionParser> Section(std::string_view name) = 0;

	/* virtual methods from ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;
};
