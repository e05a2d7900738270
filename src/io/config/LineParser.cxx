// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"

#include <string>

#include <stdlib.h>
#include <string.h>

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error(std::string("Unexpected tokens at end of line: ") + p);
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		/* garbage after the word */
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (!IsEnd()) {
		if (!IsWhitespaceNotNull(front()))
			return nullptr;

		*p++ = 0;
		Strip();
	}

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *result = p;
	char *q = strchr(p, stop);
	if (q == nullptr)
		return nullptr;

	*q++ = 0;
	p = StripLeft(q);
	return result;
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front())) {
		const char stop = *p++;
		return NextQuotedValue(stop);
	}

	if (!IsUnquotedChar(front()))
		return nullptr;

	return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return NextValue();

	char *dest = ++p;
	char *value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;
		else if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		} else if (ch == '\\' && stop == '"') {
			ch = *p++;
			if (ch == 0)
				return nullptr;

			*dest++ = ch;
		} else
			*dest++ = ch;
	}
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0)
		return true;
	else if (strcmp(value, "no") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

unsigned
LineParser::NextPositiveInteger()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Positive integer expected");

	char *endptr;
	unsigned long l = strtoul(string, &endptr, 10);
	if (endptr == string || *endptr != 0)
		throw Error("Positive integer expected");

	if (l == 0)
		throw Error("Positive number expected");

	if (l > (1ul << 31))
		throw Error("Number is too large");

	return l;
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
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
