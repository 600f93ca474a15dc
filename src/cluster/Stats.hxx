// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <vector>

struct NodeStats {
	std::string name;

	/**
	 * The validated host, formatted as "name port".
	 */
	std::string host;

	/**
	 * Connections currently borrowed from the pools.
	 */
	unsigned in_use = 0;

	/**
	 * Idle connections in the pools.
	 */
	unsigned in_pool = 0;

	unsigned long opened = 0, closed = 0;

	/**
	 * Connection errors in the current error rate window.
	 */
	unsigned error_count = 0;

	bool active = false;
};

struct ClusterStats {
	std::vector<NodeStats> nodes;

	/**
	 * How often routing found no usable node.
	 */
	unsigned invalid_node_count = 0;

	unsigned long tend_count = 0;
};
