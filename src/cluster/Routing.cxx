// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * The read path: map a partition to a node.  All methods obtain
 * the snapshot exactly once and never block.
 */

#include "Cluster.hxx"
#include "Node.hxx"
#include "Error.hxx"

static const Partitions &
GetPartitions(const ClusterSnapshot &snapshot, const Partition &partition)
{
	const auto &map = *snapshot.partition_map;
	auto i = map.find(partition.ns);
	if (i == map.end())
		throw InvalidNamespaceError(partition.ns, map.size());

	const auto &partitions = *i->second;
	if (partition.id >= partitions.GetPartitionCount())
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "Invalid partition id {}", partition.id);

	return partitions;
}

static bool
IsActive(const std::shared_ptr<Node> &node) noexcept
{
	return node != nullptr && node->IsActive();
}

std::shared_ptr<Node>
Cluster::GetMasterNode(const Partition &partition) const
{
	const auto current = GetSnapshot();
	const auto &partitions = GetPartitions(*current, partition);

	const auto &node = partitions.replicas.front()[partition.id];
	if (IsActive(node))
		return node;

	invalid_node_count.fetch_add(1, std::memory_order_relaxed);
	throw InvalidNodeError(partition.id);
}

static std::shared_ptr<Node>
GetRandomNode(const ClusterSnapshot &snapshot, std::atomic_uint &node_index,
	      std::atomic_uint &invalid_node_count)
{
	const auto &nodes = snapshot.nodes;
	const std::size_t n = nodes.size();

	for (std::size_t i = 0; i < n; ++i) {
		const auto &node = nodes[node_index.fetch_add(1, std::memory_order_relaxed) % n];
		if (node->IsActive())
			return node;
	}

	invalid_node_count.fetch_add(1, std::memory_order_relaxed);
	throw InvalidNodeError("Cluster is empty");
}

std::shared_ptr<Node>
Cluster::GetMasterProlesNode(const Partition &partition) const
{
	const auto current = GetSnapshot();
	const auto &partitions = GetPartitions(*current, partition);
	const auto &replicas = partitions.replicas;
	const unsigned n = replicas.size();

	for (unsigned i = 0; i < n; ++i) {
		const unsigned index = replica_index.fetch_add(1, std::memory_order_relaxed) % n;
		const auto &node = replicas[index][partition.id];
		if (IsActive(node))
			return node;
	}

	if (partitions.cp_mode) {
		/* no unsafe reads from nodes which do not own the
		   partition */
		invalid_node_count.fetch_add(1, std::memory_order_relaxed);
		throw InvalidNodeError(partition.id);
	}

	return ::GetRandomNode(*current, node_index, invalid_node_count);
}

std::shared_ptr<Node>
Cluster::GetSequenceNode(const Partition &partition) const
{
	const auto current = GetSnapshot();
	const auto &partitions = GetPartitions(*current, partition);

	for (const auto &replica : partitions.replicas) {
		const auto &node = replica[partition.id];
		if (IsActive(node))
			return node;
	}

	if (partitions.cp_mode) {
		invalid_node_count.fetch_add(1, std::memory_order_relaxed);
		throw InvalidNodeError(partition.id);
	}

	return ::GetRandomNode(*current, node_index, invalid_node_count);
}

std::shared_ptr<Node>
Cluster::GetRackNode(const Partition &partition) const
{
	const auto current = GetSnapshot();
	const auto &partitions = GetPartitions(*current, partition);

	for (const unsigned rack_id : config.rack_ids) {
		for (const auto &replica : partitions.replicas) {
			const auto &node = replica[partition.id];
			if (IsActive(node) && node->HasRack(partition.ns, rack_id))
				return node;
		}
	}

	for (const auto &replica : partitions.replicas) {
		const auto &node = replica[partition.id];
		if (IsActive(node))
			return node;
	}

	invalid_node_count.fetch_add(1, std::memory_order_relaxed);
	throw InvalidNodeError(partition.id);
}

std::shared_ptr<Node>
Cluster::GetRandomNode() const
{
	return ::GetRandomNode(*GetSnapshot(), node_index, invalid_node_count);
}

std::shared_ptr<Node>
Cluster::GetNodeForRead(ReplicaPolicy policy,
			const Partition &partition) const
{
	switch (policy) {
	case ReplicaPolicy::MASTER:
		break;

	case ReplicaPolicy::MASTER_PROLES:
		return GetMasterProlesNode(partition);

	case ReplicaPolicy::SEQUENCE:
		return GetSequenceNode(partition);

	case ReplicaPolicy::RANDOM:
		return GetRandomNode();

	case ReplicaPolicy::PREFER_RACK:
		return GetRackNode(partition);
	}

	return GetMasterNode(partition);
}
