// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <chrono>
#include <cstdint>

/**
 * Limits of one scan/query.
 */
struct ScanPolicy {
	/**
	 * Timeout of each request to a node; 0 means none.
	 */
	std::chrono::milliseconds socket_timeout{30000};

	/**
	 * Timeout of the whole operation including retries; 0 means
	 * none.
	 */
	std::chrono::milliseconds total_timeout{0};

	std::chrono::milliseconds sleep_between_retries{0};

	/**
	 * The maximum number of rounds after the first one.
	 */
	unsigned max_retries = 5;

	/**
	 * The approximate maximum number of records to return; 0
	 * means no limit.
	 */
	int64_t max_records = 0;
};
