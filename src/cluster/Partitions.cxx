// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Partitions.hxx"

#include <algorithm>

Partitions::Partitions(unsigned partition_count, unsigned replica_count,
		       bool _cp_mode)
	:replicas(replica_count,
		  std::vector<std::shared_ptr<Node>>(partition_count)),
	 regimes(partition_count, 0),
	 cp_mode(_cp_mode)
{
}

Partitions::Partitions(const Partitions &src, unsigned replica_count)
	:regimes(src.regimes),
	 cp_mode(src.cp_mode)
{
	const unsigned partition_count = src.GetPartitionCount();
	const unsigned n = std::min(replica_count, src.GetReplicaCount());

	replicas.reserve(replica_count);
	replicas.insert(replicas.end(),
			src.replicas.begin(), std::next(src.replicas.begin(), n));
	replicas.resize(replica_count,
			std::vector<std::shared_ptr<Node>>(partition_count));
}

bool
Partitions::Contains(const Node &node) const noexcept
{
	for (const auto &nodes : replicas)
		for (const auto &i : nodes)
			if (i.get() == &node)
				return true;

	return false;
}

bool
PartitionMapContains(const PartitionMap &map, const Node &node) noexcept
{
	return std::any_of(map.begin(), map.end(), [&node](const auto &i){
		return i.second->Contains(node);
	});
}

PartitionMapBuilder::PartitionMapBuilder(std::shared_ptr<const PartitionMap> _base)
	:base(_base != nullptr ? std::move(_base)
	      : std::make_shared<const PartitionMap>())
{
}

PartitionMap &
PartitionMapBuilder::MakeCopy()
{
	if (copy == nullptr)
		copy = std::make_shared<PartitionMap>(*base);

	return *copy;
}

const Partitions *
PartitionMapBuilder::Find(std::string_view ns) const noexcept
{
	const auto &map = Get();
	auto i = map.find(ns);
	return i != map.end() ? i->second.get() : nullptr;
}

Partitions &
PartitionMapBuilder::Edit(std::string_view ns)
{
	if (auto i = writable.find(ns); i != writable.end())
		return *i->second;

	auto &map = MakeCopy();
	auto i = map.find(ns);
	auto p = std::make_shared<Partitions>(*i->second);
	i->second = p;
	writable.emplace(ns, p);
	return *p;
}

Partitions &
PartitionMapBuilder::Put(std::string_view ns,
			 std::shared_ptr<Partitions> partitions)
{
	auto &map = MakeCopy();
	auto &p = *partitions;
	map.insert_or_assign(std::string{ns}, partitions);
	writable.insert_or_assign(std::string{ns}, std::move(partitions));
	return p;
}

std::shared_ptr<const PartitionMap>
PartitionMapBuilder::Commit() noexcept
{
	writable.clear();

	if (copy == nullptr)
		return base;

	base = std::move(copy);
	return base;
}
