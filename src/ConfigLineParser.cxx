// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ConfigLineParser.hxx"
#include "StringUtil.hxx"

#include <charconv>

using std::string_view_literals::operator""sv;

static constexpr bool
IsWordChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') || ch == '_' || ch == '-';
}

inline void
ConfigLineParser::SkipWhitespace() noexcept
{
	rest = StripLeft(rest);
}

bool
ConfigLineParser::IsEnd() const noexcept
{
	const auto s = StripLeft(rest);
	return s.empty() || s.front() == '#';
}

void
ConfigLineParser::ExpectEnd() const
{
	if (!IsEnd())
		throw Error{"Unexpected tokens at end of line"};
}

std::string_view
ConfigLineParser::ExpectWord()
{
	SkipWhitespace();

	std::size_t n = 0;
	while (n < rest.size() && IsWordChar(rest[n]))
		++n;

	if (n == 0)
		throw Error{"Word expected"};

	const auto word = rest.substr(0, n);
	rest.remove_prefix(n);

	if (!rest.empty() && !IsWhitespaceASCII(rest.front()))
		throw Error{"Whitespace expected after word"};

	return word;
}

std::string
ConfigLineParser::ExpectValue()
{
	SkipWhitespace();

	if (rest.empty() || rest.front() == '#')
		throw Error{"Value expected"};

	if (rest.front() == '"') {
		const auto end = rest.find('"', 1);
		if (end == rest.npos)
			throw Error{"Missing closing quote"};

		std::string value{rest.substr(1, end - 1)};
		rest.remove_prefix(end + 1);
		return value;
	}

	std::size_t n = 0;
	while (n < rest.size() && !IsWhitespaceASCII(rest[n]))
		++n;

	std::string value{rest.substr(0, n)};
	rest.remove_prefix(n);
	return value;
}

bool
ConfigLineParser::NextBool()
{
	return ParseBool(ExpectValue());
}

unsigned long
ConfigLineParser::NextUnsigned()
{
	return ParseUnsigned(ExpectValue());
}

unsigned long
ConfigLineParser::NextPositiveInteger()
{
	return ParsePositiveInteger(ExpectValue());
}

bool
ParseBool(std::string_view s)
{
	if (s == "yes"sv || s == "true"sv || s == "on"sv || s == "1"sv)
		return true;

	if (s == "no"sv || s == "false"sv || s == "off"sv || s == "0"sv)
		return false;

	throw ConfigLineParser::Error{"Yes/no expected"};
}

unsigned long
ParseUnsigned(std::string_view s)
{
	unsigned long value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value);
	if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty())
		throw ConfigLineParser::Error{"Not a valid number"};

	return value;
}

unsigned long
ParsePositiveInteger(std::string_view s)
{
	const auto value = ParseUnsigned(s);
	if (value == 0)
		throw ConfigLineParser::Error{"Positive number expected"};

	return value;
}
