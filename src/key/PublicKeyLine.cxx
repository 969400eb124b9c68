// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "PublicKeyLine.hxx"
#include "KeyType.hxx"
#include "StringUtil.hxx"

#include <tuple> // for std::tie()

static constexpr bool
IsLowerAlphaASCII(char ch) noexcept
{
	return ch >= 'a' && ch <= 'z';
}

static constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

static constexpr bool
IsOptionNameStartChar(char ch) noexcept
{
	return IsLowerAlphaASCII(ch) || (ch >= 'A' && ch <= 'Z');
}

static constexpr bool
IsOptionNameMiddleChar(char ch) noexcept
{
	return IsOptionNameStartChar(ch) || IsDigitASCII(ch) ||
		ch == '-' || ch == '_' || ch == '@' || ch == '.';
}

static constexpr bool
IsDecimal(std::string_view s) noexcept
{
	if (s.empty())
		return false;

	for (const char ch : s)
		if (!IsDigitASCII(ch))
			return false;

	return true;
}

/**
 * Skip one option name.
 *
 * @return the position after the name or npos on error
 */
static constexpr std::size_t
SkipOptionName(std::string_view s, std::size_t i) noexcept
{
	if (i >= s.size() || !IsOptionNameStartChar(s[i]))
		return s.npos;

	++i;
	while (i < s.size() && IsOptionNameMiddleChar(s[i]))
		++i;

	return i;
}

/**
 * Skip an option value (after the '=').
 *
 * @return the position after the value or npos on error
 */
static constexpr std::size_t
SkipOptionValue(std::string_view s, std::size_t i) noexcept
{
	if (i < s.size() && s[i] == '"') {
		++i;

		while (true) {
			if (i >= s.size())
				return s.npos;

			if (s[i] == '"')
				return i + 1;

			if (s[i] == '\\') {
				++i;
				if (i >= s.size())
					return s.npos;
			}

			++i;
		}
	} else {
		while (i < s.size() && s[i] != ',' && !IsWhitespaceASCII(s[i]))
			++i;

		return i;
	}
}

/**
 * Find the end of the comma-separated authorized_keys options at
 * the beginning of the line.
 *
 * @return the position of the whitespace after the options or
 * npos on error
 */
static constexpr std::size_t
SkipOptions(std::string_view s) noexcept
{
	std::size_t i = 0;

	while (true) {
		i = SkipOptionName(s, i);
		if (i == s.npos)
			return i;

		if (i < s.size() && s[i] == '=') {
			i = SkipOptionValue(s, i + 1);
			if (i == s.npos)
				return i;
		}

		if (i >= s.size())
			/* options without a key */
			return s.npos;

		if (IsWhitespaceASCII(s[i]))
			return i;

		if (s[i] != ',')
			return s.npos;

		++i;
	}
}

/**
 * Parse the key part of a line (after the options).
 */
static std::optional<PublicKeyLine>
ParseKey(std::string_view s) noexcept
{
	PublicKeyLine result;

	auto [first, rest] = SplitWord(s);

	if (IsDecimal(first)) {
		/* SSH1: bits exponent modulus [comment] */
		result.bits = first;
		std::tie(result.exponent, rest) = SplitWord(rest);
		std::tie(result.modulus, rest) = SplitWord(rest);
		if (!IsDecimal(result.exponent) || !IsDecimal(result.modulus))
			return std::nullopt;
	} else if (MaybeKeyAlgorithm(first)) {
		result.algorithm = first;
		std::tie(result.blob, rest) = SplitWord(rest);
		if (result.blob.empty())
			return std::nullopt;
	} else
		return std::nullopt;

	result.comment = StripRight(rest);
	return result;
}

std::optional<PublicKeyLine>
ParsePublicKeyLine(std::string_view line) noexcept
{
	line = Strip(line);
	if (line.empty() || line.front() == '#')
		return std::nullopt;

	if (auto result = ParseKey(line))
		return result;

	const auto options_end = SkipOptions(line);
	if (options_end == line.npos)
		return std::nullopt;

	auto result = ParseKey(line.substr(options_end));
	if (result)
		result->options = line.substr(0, options_end);

	return result;
}

std::string_view
FindFirstPublicKeyLine(std::string_view text) noexcept
{
	LineSplitter lines{text};
	while (const auto line = lines.Next())
		if (ParsePublicKeyLine(*line))
			return Strip(*line);

	return {};
}
