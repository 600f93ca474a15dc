// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string_view>

/**
 * Optional server capabilities, announced by the "features" info
 * command.  Used as bit mask.
 */
enum class NodeFeature : unsigned {
	GEO = 0x1,
	DOUBLE = 0x2,
	BATCH_INDEX = 0x4,
	REPLICAS = 0x8,
	REPLICAS_ALL = 0x10,
	PEERS = 0x20,
	PARTITION_QUERY = 0x40,
	PARTITION_SCAN = 0x80,
};

/**
 * All features; the neutral element for combining the features of
 * all nodes with bitwise "and".
 */
static constexpr unsigned ALL_NODE_FEATURES = 0xff;

constexpr bool
HasFeature(unsigned mask, NodeFeature feature) noexcept
{
	return (mask & unsigned(feature)) != 0;
}

/**
 * Parse the semicolon-separated response of the "features"
 * command into a bit mask.  Unknown features are ignored.
 */
[[gnu::pure]]
unsigned
ParseFeatures(std::string_view s) noexcept;
