// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "cluster/Partition.hxx"

#include <cstdint>
#include <memory>
#include <optional>

class Node;

/**
 * The progress of a scan/query in one partition.
 */
struct PartitionStatus {
	/**
	 * The digest of the last record received; the next attempt
	 * resumes after it.
	 */
	std::optional<Digest> digest;

	/**
	 * The secondary index value of the last record (queries
	 * only).
	 */
	uint64_t bval = 0;

	/**
	 * The node this partition was last assigned to.
	 */
	std::shared_ptr<Node> node;

	unsigned id;

	int sequence = 0;

	/**
	 * Must this partition be (re)queried in the next round?
	 */
	bool retry = true;

	explicit PartitionStatus(unsigned _id) noexcept
		:id(_id) {}
};
