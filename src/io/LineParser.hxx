// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "util/StringUtil.hxx"

#include <stdexcept>
#include <string>

/**
 * Tokenizer for one line of a configuration file.  It modifies the
 * buffer in place (null-terminating tokens).
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept
		:p(StripLeft(_p)) {
		StripRight(p);
	}

	LineParser(const LineParser &) = delete;
	LineParser &operator=(const LineParser &) = delete;

	char *Rest() noexcept {
		return p;
	}

	/**
	 * Replace the remaining input with a different buffer (used
	 * after variable expansion).
	 */
	void Replace(char *_p) noexcept {
		p = _p;
	}

	void Strip() noexcept {
		p = StripLeft(p);
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd() {
		if (!IsEnd())
			throw Error(std::string("Unexpected tokens at end of line: ") + p);
	}

	void ExpectSymbol(char symbol) {
		if (front() != symbol)
			throw Error(std::string("'") + symbol + "' expected");

		++p;
		Strip();
	}

	void ExpectSymbolAndEol(char symbol) {
		ExpectSymbol(symbol);

		if (!IsEnd())
			throw Error(std::string("Unexpected tokens after '")
				    + symbol + "': " + p);
	}

	bool SkipSymbol(char symbol) noexcept {
		bool found = front() == symbol;
		if (found) {
			++p;
			Strip();
		}
		return found;
	}

	/**
	 * If the next word matches the given parameter, then skip it and
	 * return true.  If not, the method returns false, leaving the
	 * object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	const char *NextWord() noexcept;
	char *NextValue() noexcept;
	char *NextUnescape() noexcept;

	bool NextBool();
	unsigned NextPositiveInteger();

	const char *ExpectWord();

	const char *ExpectWordAndSymbol(char symbol,
					const char *error1,
					const char *error2);

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

private:
	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
