// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"

#include <cstdlib>
#include <cstring>
#include <string>

static constexpr bool
IsWhitespaceOrNull(char ch) noexcept
{
	return static_cast<unsigned char>(ch) <= 0x20;
}

static constexpr bool
IsWhitespaceNotNull(char ch) noexcept
{
	return ch != 0 && IsWhitespaceOrNull(ch);
}

static char *
StripLeft(char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;
	return p;
}

static void
StripRight(char *p) noexcept
{
	std::size_t length = strlen(p);
	while (length > 0 && IsWhitespaceOrNull(p[length - 1]))
		--length;
	p[length] = 0;
}

LineParser::LineParser(char *_p) noexcept
	:p(StripLeft(_p))
{
	StripRight(p);
}

void
LineParser::Strip() noexcept
{
	p = StripLeft(p);
}

void
LineParser::ExpectEnd()
{
	Strip();

	if (!IsEnd())
		throw Error(std::string("Unexpected tokens at end of line: ") + p);
}

void
LineParser::ExpectSymbol(char symbol)
{
	if (front() != symbol)
		throw Error(std::string("'") + symbol + "' expected");

	++p;
	Strip();
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *const value = p;
	while (IsUnquotedChar(front()))
		++p;

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		/* garbage after the value */
		return nullptr;

	return value;
}

inline char *
LineParser::NextQuotedValue(char stop) noexcept
{
	char *const value = p;
	char *end = strchr(p, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = end + 1;
	Strip();

	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsEnd())
		return nullptr;

	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	}

	if (!IsUnquotedChar(ch))
		return nullptr;

	return NextUnquotedValue();
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0 || strcmp(value, "true") == 0 ||
	    strcmp(value, "on") == 0)
		return true;

	if (strcmp(value, "no") == 0 || strcmp(value, "false") == 0 ||
	    strcmp(value, "off") == 0)
		return false;

	throw Error("yes/no expected");
}

unsigned long long
LineParser::NextPositiveInteger()
{
	const char *value = NextValue();
	if (value == nullptr || *value < '0' || *value > '9')
		throw Error("Positive integer expected");

	char *endptr;
	const auto l = strtoull(value, &endptr, 10);
	if (*endptr != 0)
		throw Error("Positive integer expected");

	return l;
}

const char *
LineParser::ExpectWordAndSymbol(char symbol,
				const char *error1, const char *error2)
{
	char *const name = p;
	if (!IsWordChar(front()))
		throw Error(error1);

	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	}

	if (front() != symbol)
		throw Error(error2);

	/* this also terminates the name if there was no whitespace */
	*p++ = 0;
	Strip();

	return name;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
