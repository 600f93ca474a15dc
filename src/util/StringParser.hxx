// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

/**
 * Parse a non-negative decimal integer.
 *
 * Throws std::invalid_argument on error.
 */
unsigned long
ParseUnsignedLong(const char *s);

/**
 * Parse "yes" or "no".
 *
 * Throws std::invalid_argument on error.
 */
bool
ParseBool(const char *s);
