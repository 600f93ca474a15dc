// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <system_error>

#include <errno.h>

/**
 * Build a std::system_error from an errno value.
 */
static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, std::system_category(), msg);
}

static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}
