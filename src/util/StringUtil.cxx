// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "StringUtil.hxx"

char *
StripLeft(char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;
	return p;
}

void
StripRight(char *p) noexcept
{
	size_t length = strlen(p);
	while (length > 0 && IsWhitespaceOrNull(p[length - 1]))
		--length;
	p[length] = 0;
}

std::string_view
Strip(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && IsWhitespaceOrNull(s.back()))
		s.remove_suffix(1);
	return s;
}

std::vector<std::string_view>
SplitString(std::string_view s, char separator) noexcept
{
	std::vector<std::string_view> result;
	if (s.empty())
		return result;

	while (true) {
		const auto i = s.find(separator);
		if (i == s.npos) {
			result.push_back(s);
			break;
		}

		result.push_back(s.substr(0, i));
		s = s.substr(i + 1);
	}

	return result;
}
