// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string_view>
#include <vector>

#include <string.h>

static constexpr bool
IsWhitespaceOrNull(char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

static constexpr bool
IsWhitespaceNotNull(char ch) noexcept
{
	return ch > 0 && ch <= 0x20;
}

static constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

static constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return IsDigitASCII(ch) ||
		(ch >= 'a' && ch <= 'z') ||
		(ch >= 'A' && ch <= 'Z');
}

[[gnu::pure]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

[[gnu::pure]]
char *
StripLeft(char *p) noexcept;

/**
 * Null-terminate the string after the last non-whitespace
 * character.
 */
void
StripRight(char *p) noexcept;

[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;

/**
 * Split the string at each occurrence of the separator.  Empty
 * segments are preserved.
 */
std::vector<std::string_view>
SplitString(std::string_view s, char separator) noexcept;
