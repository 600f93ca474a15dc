// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "PartitionStatus.hxx"

#include <cstdint>
#include <memory>
#include <vector>

class Node;

/**
 * One unit of work of a scan/query: the partitions assigned to one
 * node in one round.
 */
struct NodePartitions {
	std::shared_ptr<Node> node;

	/**
	 * Partitions which are queried from the beginning.
	 */
	std::vector<PartitionStatus *> parts_full;

	/**
	 * Partitions which are resumed after a digest.
	 */
	std::vector<PartitionStatus *> parts_partial;

	uint64_t record_count = 0;

	/**
	 * The maximum number of records to be received from this
	 * node; 0 means no limit.
	 */
	uint64_t record_max = 0;

	unsigned parts_unavailable = 0;

	NodePartitions(std::shared_ptr<Node> _node, std::size_t capacity) noexcept
		:node(std::move(_node)) {
		parts_full.reserve(capacity);
		parts_partial.reserve(capacity);
	}

	void AddPartition(PartitionStatus &part) noexcept {
		if (part.digest)
			parts_partial.push_back(&part);
		else
			parts_full.push_back(&part);
	}

	std::size_t GetPartitionCount() const noexcept {
		return parts_full.size() + parts_partial.size();
	}
};
