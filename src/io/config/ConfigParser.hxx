// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Give this parser a chance to consume the line before
	 * ParseLine() is called.
	 *
	 * @return true if the line was consumed
	 */
	virtual bool PreParseLine(LineParser &line);

	virtual void ParseLine(LineParser &line) = 0;

	/**
	 * Called at the end of the file.  May throw if the
	 * configuration is incomplete.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Feed all lines of the given file into the parser and call its
 * Finish() method.
 *
 * Throws on I/O error and on syntax errors; the latter are nested
 * in an exception containing the file name and the line number.
 */
void
ParseConfigFile(const char *path, ConfigParser &parser);
