// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <kvcluster/Protocol.hxx>

#include <string_view>

class Node;
class Logger;
class PartitionMapBuilder;

/**
 * The info command which returns the replica ownership of a node.
 * "replicas" (which includes the regime) is used if the node
 * supports it.
 */
[[gnu::pure]]
const char *
GetReplicasCommand(const Node &node) noexcept;

/**
 * Apply the value of a "replicas"/"replicas-all" info command to
 * the partition map builder.  The format is:
 *
 *     NS:[REGIME,]COUNT,BITMAP,...;NS:...
 *
 * Each BITMAP is the base64 encoded ownership bit set of one
 * replica level (most significant bit first).  Every partition whose
 * bit is set is assigned to #node, unless the map has already seen a
 * newer regime for it.  The previous owner of a partition which
 * changes hands gets its partition generation reset, so it will be
 * asked again.
 *
 * Throws #ClusterError (PARSE_ERROR) on malformed input; the
 * builder is not modified then.
 */
void
ParsePartitions(std::string_view response, bool with_regime,
		Node &node, PartitionMapBuilder &builder,
		const Logger &logger,
		unsigned partition_count=KvCluster::PARTITIONS);
