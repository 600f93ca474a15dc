// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <exception>
#include <string>

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain.
 */
std::string
GetFullMessage(const std::exception &e,
	       const char *separator="; ") noexcept;

/**
 * Like the other overload, but take an exception_ptr.  Unknown
 * exception types are described as "Unknown exception".
 */
std::string
GetFullMessage(std::exception_ptr ep,
	       const char *separator="; ") noexcept;

/**
 * Print the full message of the given exception to stderr.
 */
void
PrintException(std::exception_ptr ep) noexcept;
