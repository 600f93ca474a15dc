// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * The RIPEMD-160 digest of a record key, as computed by the record
 * codec.
 */
using Digest = std::array<uint8_t, 20>;

/**
 * Calculate the partition of a key digest.
 */
[[gnu::pure]]
unsigned
GetPartitionId(const Digest &digest) noexcept;

/**
 * Identifies one partition of a namespace.
 */
struct Partition {
	std::string ns;
	unsigned id;

	Partition(std::string_view _ns, unsigned _id)
		:ns(_ns), id(_id) {}

	static Partition FromDigest(std::string_view ns,
				    const Digest &digest) {
		return {ns, GetPartitionId(digest)};
	}
};

/**
 * Which replica shall serve a read?
 */
enum class ReplicaPolicy {
	/**
	 * Always the master.
	 */
	MASTER,

	/**
	 * Distribute reads across master and replicas (round robin).
	 */
	MASTER_PROLES,

	/**
	 * The first active node in replica priority order.
	 */
	SEQUENCE,

	/**
	 * Any node of the cluster.
	 */
	RANDOM,

	/**
	 * The first active replica on one of the client's racks (in
	 * the configured order of preference), else the first active
	 * replica.
	 */
	PREFER_RACK,
};
