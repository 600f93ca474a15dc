// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class Node;

/**
 * The partition ownership table of one namespace:
 * replicas[replica_index][partition_id] is the node holding that
 * copy.  replicas[0] are the masters.  Cells may be empty while the
 * ownership is not yet known.
 *
 * Instances are immutable once published in a #PartitionMap.
 */
struct Partitions {
	std::vector<std::vector<std::shared_ptr<Node>>> replicas;

	/**
	 * The regime of each partition (only used in strong
	 * consistency mode); updates from older regimes are ignored.
	 */
	std::vector<int> regimes;

	/**
	 * Is this namespace in strong consistency ("CP") mode?
	 */
	bool cp_mode;

	Partitions(unsigned partition_count, unsigned replica_count,
		   bool _cp_mode);

	/**
	 * Copy the table, changing the number of replicas.  Replica
	 * levels which are added are empty.
	 */
	Partitions(const Partitions &src, unsigned replica_count);

	Partitions(const Partitions &) = default;

	unsigned GetReplicaCount() const noexcept {
		return replicas.size();
	}

	unsigned GetPartitionCount() const noexcept {
		return regimes.size();
	}

	/**
	 * Does the given node own (or replicate) any partition?
	 */
	[[gnu::pure]]
	bool Contains(const Node &node) const noexcept;
};

/**
 * Namespace name to partition table.  Published as a whole through
 * an atomic pointer; never modified after publication.
 */
using PartitionMap = std::map<std::string, std::shared_ptr<const Partitions>,
			      std::less<>>;

[[gnu::pure]]
bool
PartitionMapContains(const PartitionMap &map, const Node &node) noexcept;

/**
 * Collects the partition updates of one tend cycle.  The map and
 * each namespace table are copied on the first modification, so an
 * unchanged cycle commits the very same map instance.
 */
class PartitionMapBuilder {
	std::shared_ptr<const PartitionMap> base;

	/**
	 * The private copy of #base; nullptr until the first
	 * modification.
	 */
	std::shared_ptr<PartitionMap> copy;

	/**
	 * Namespace tables which have been copied in this cycle and
	 * may be modified in place.
	 */
	std::map<std::string, std::shared_ptr<Partitions>, std::less<>> writable;

public:
	explicit PartitionMapBuilder(std::shared_ptr<const PartitionMap> _base);

	PartitionMapBuilder(const PartitionMapBuilder &) = delete;
	PartitionMapBuilder &operator=(const PartitionMapBuilder &) = delete;

	bool IsModified() const noexcept {
		return copy != nullptr;
	}

	/**
	 * The current state, including all modifications.
	 */
	const PartitionMap &Get() const noexcept {
		return copy != nullptr ? *copy : *base;
	}

	[[gnu::pure]]
	const Partitions *Find(std::string_view ns) const noexcept;

	/**
	 * Obtain a writable table for the given (existing) namespace.
	 */
	Partitions &Edit(std::string_view ns);

	/**
	 * Insert or replace the table of a namespace.
	 */
	Partitions &Put(std::string_view ns,
			std::shared_ptr<Partitions> partitions);

	/**
	 * Return the resulting map.  If nothing was modified, this is
	 * the base map.
	 */
	std::shared_ptr<const PartitionMap> Commit() noexcept;

private:
	PartitionMap &MakeCopy();
};
