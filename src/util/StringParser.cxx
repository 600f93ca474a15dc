// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "StringParser.hxx"
#include "StringUtil.hxx"

#include <stdexcept>

#include <stdlib.h>

unsigned long
ParseUnsignedLong(const char *s)
{
	char *endptr;
	const auto value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-')
		throw std::invalid_argument("Failed to parse number");

	return value;
}

bool
ParseBool(const char *s)
{
	if (StringIsEqual(s, "yes"))
		return true;
	else if (StringIsEqual(s, "no"))
		return false;
	else
		throw std::invalid_argument("Failed to parse boolean; expected 'yes' or 'no'");
}
