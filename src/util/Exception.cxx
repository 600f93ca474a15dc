// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Exception.hxx"

#include <fmt/core.h>

static void
AppendNested(std::string &result, const std::exception &e,
	     const char *separator) noexcept
try {
	std::rethrow_if_nested(e);
} catch (const std::exception &nested) {
	result += separator;
	result += nested.what();
	AppendNested(result, nested, separator);
} catch (...) {
	result += separator;
	result += "Unknown exception";
}

std::string
GetFullMessage(const std::exception &e, const char *separator) noexcept
{
	std::string result = e.what();
	AppendNested(result, e, separator);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep, const char *separator) noexcept
{
	if (!ep)
		return "Null exception";

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return "Unknown exception";
	}
}

void
PrintException(std::exception_ptr ep) noexcept
{
	fmt::print(stderr, "{}\n", GetFullMessage(ep, "\n  "));
}
