// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * Tokenizer for one line of a "keyword value" configuration file.
 */
class ConfigLineParser {
	std::string_view rest;

public:
	/**
	 * A syntax error in the current line.  The file name and line
	 * number are added by LoadConfigFile().
	 */
	class Error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	explicit constexpr ConfigLineParser(std::string_view _line) noexcept
		:rest(_line) {}

	bool IsEnd() const noexcept;

	/**
	 * Throws if there are more (non-whitespace) characters.
	 */
	void ExpectEnd() const;

	/**
	 * Returns the next keyword (letters, digits, '_' and '-').
	 * Throws if there is none.
	 */
	std::string_view ExpectWord();

	/**
	 * Returns the next value, which may be enclosed in double
	 * quotes.  Throws if there is none.
	 */
	std::string ExpectValue();

	std::string ExpectValueAndEnd() {
		auto value = ExpectValue();
		ExpectEnd();
		return value;
	}

	/**
	 * Parse "yes"/"no" (also "true"/"false", "on"/"off", "1"/"0").
	 */
	bool NextBool();

	unsigned long NextUnsigned();

	unsigned long NextPositiveInteger();

private:
	void SkipWhitespace() noexcept;
};

/**
 * Parse a boolean value (see ConfigLineParser::NextBool()).
 * Throws ConfigLineParser::Error on error.
 */
bool
ParseBool(std::string_view s);

/**
 * Parse a non-negative decimal integer.  Throws
 * ConfigLineParser::Error on error.
 */
unsigned long
ParseUnsigned(std::string_view s);

unsigned long
ParsePositiveInteger(std::string_view s);
