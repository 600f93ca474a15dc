// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "PartitionStatus.hxx"

#include <kvcluster/Protocol.hxx>

#include <optional>
#include <vector>

/**
 * Selects the partitions of a scan/query and remembers the progress
 * in each of them.  Passing the same instance to another scan/query
 * continues where the previous one stopped.
 */
struct PartitionFilter {
	unsigned begin;
	unsigned count;

	/**
	 * Start after this record (only used for the first partition).
	 */
	std::optional<Digest> digest;

	/**
	 * The status of each partition; empty until the filter is used
	 * for the first time.
	 */
	std::vector<PartitionStatus> partitions;

	/**
	 * Have all partitions been drained?
	 */
	bool done = false;

	/**
	 * Must all partitions be queried again?  Cleared when a
	 * scan/query with a record limit completes normally; then only
	 * the partitions with PartitionStatus::retry are queried next
	 * time.
	 */
	bool retry = false;

	PartitionFilter(unsigned _begin, unsigned _count) noexcept
		:begin(_begin), count(_count) {}

	static PartitionFilter All() noexcept {
		return {0, KvCluster::PARTITIONS};
	}

	static PartitionFilter Id(unsigned id) noexcept {
		return {id, 1};
	}

	static PartitionFilter Range(unsigned begin, unsigned count) noexcept {
		return {begin, count};
	}

	/**
	 * Start after the record with the given digest, in its
	 * partition only.
	 */
	static PartitionFilter After(const Digest &digest) noexcept {
		PartitionFilter filter{GetPartitionId(digest), 1};
		filter.digest = digest;
		return filter;
	}

	bool IsDone() const noexcept {
		return done;
	}
};
