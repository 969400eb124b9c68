// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string_view>
#include <utility>

constexpr bool
IsWhitespaceASCII(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

constexpr std::string_view
StripLeft(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceASCII(s.front()))
		s.remove_prefix(1);
	return s;
}

constexpr std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceASCII(s.back()))
		s.remove_suffix(1);
	return s;
}

constexpr std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}

constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch;
}

constexpr bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size())
		return false;

	for (std::size_t i = 0; i < a.size(); ++i)
		if (ToLowerASCII(a[i]) != ToLowerASCII(b[i]))
			return false;

	return true;
}

constexpr bool
StartsWithIgnoreCase(std::string_view s, std::string_view prefix) noexcept
{
	return s.size() >= prefix.size() &&
		StringIsEqualIgnoreCase(s.substr(0, prefix.size()), prefix);
}

/**
 * Split the string at the first occurrence of the given character.
 * If it is not found, the second part is empty.
 */
constexpr std::pair<std::string_view, std::string_view>
Split(std::string_view s, char separator) noexcept
{
	const auto i = s.find(separator);
	if (i == s.npos)
		return {s, {}};

	return {s.substr(0, i), s.substr(i + 1)};
}

/**
 * Split a string into whitespace-separated words, collapsing runs
 * of whitespace.  Returns the first word and the rest (with
 * leading whitespace removed).
 */
constexpr std::pair<std::string_view, std::string_view>
SplitWord(std::string_view s) noexcept
{
	s = StripLeft(s);

	std::size_t i = 0;
	while (i < s.size() && !IsWhitespaceASCII(s[i]))
		++i;

	return {s.substr(0, i), StripLeft(s.substr(i))};
}

/**
 * Iterate over the lines of a text buffer.  Line terminators
 * ("\n" or "\r\n") are not included.
 */
class LineSplitter {
	std::string_view rest;

public:
	explicit constexpr LineSplitter(std::string_view _src) noexcept
		:rest(_src) {}

	constexpr std::optional<std::string_view> Next() noexcept {
		if (rest.empty())
			return std::nullopt;

		auto [line, next] = Split(rest, '\n');
		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);

		rest = next;
		return line;
	}
};
