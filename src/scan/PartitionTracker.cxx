// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PartitionTracker.hxx"
#include "PartitionFilter.hxx"
#include "cluster/Cluster.hxx"
#include "cluster/Node.hxx"
#include "cluster/Error.hxx"

#include <kvcluster/Protocol.hxx>

#include <fmt/format.h>

#include <iterator>

using KvCluster::PARTITIONS;

static int64_t
CheckMaxRecords(int64_t max_records)
{
	if (max_records < 0)
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "Invalid maxRecords: {}", max_records);

	return max_records;
}

static PartitionFilter &
CheckFilter(PartitionFilter &filter)
{
	if (filter.begin >= PARTITIONS)
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "Invalid partition begin {}. Valid range: 0-{}",
				      filter.begin, PARTITIONS - 1);

	if (filter.count == 0)
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "Invalid partition count {}", filter.count);

	if (filter.count > PARTITIONS - filter.begin)
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "Invalid partition range ({},{})",
				      filter.begin, filter.count);

	return filter;
}

/**
 * The initial capacity of each #NodePartitions: the average number
 * of partitions per node plus 25%.
 */
static constexpr unsigned
PartitionsPerNode(std::size_t node_count) noexcept
{
	unsigned ppn = PARTITIONS / (node_count > 0 ? node_count : 1);
	ppn += ppn >> 2;
	return ppn;
}

PartitionTracker::PartitionTracker(const ScanPolicy &policy,
				   std::vector<PartitionStatus> &_partitions,
				   PartitionFilter *filter,
				   std::string_view node_name,
				   unsigned begin, unsigned _partitions_capacity,
				   std::size_t _node_capacity)
	:partitions(_partitions), partition_filter(filter),
	 node_filter(node_name),
	 partition_begin(begin),
	 partitions_capacity(_partitions_capacity),
	 node_capacity(_node_capacity),
	 socket_timeout(policy.socket_timeout),
	 total_timeout(policy.total_timeout),
	 sleep_between_retries(policy.sleep_between_retries),
	 max_records(CheckMaxRecords(policy.max_records)),
	 max_retries(policy.max_retries)
{
	if (total_timeout.count() > 0) {
		deadline = clock_type::now() + total_timeout;
		has_deadline = true;

		if (socket_timeout.count() == 0 || socket_timeout > total_timeout)
			socket_timeout = total_timeout;
	}
}

PartitionTracker::PartitionTracker(const ScanPolicy &policy,
				   std::size_t node_count)
	:PartitionTracker(policy, own_partitions, nullptr, {},
			  0, PartitionsPerNode(node_count), node_count)
{
	InitPartitions(own_partitions, PARTITIONS, nullptr);
}

PartitionTracker::PartitionTracker(const ScanPolicy &policy,
				   std::string_view node_name)
	:PartitionTracker(policy, own_partitions, nullptr, node_name,
			  0, PARTITIONS, 1)
{
	InitPartitions(own_partitions, PARTITIONS, nullptr);
}

PartitionTracker::PartitionTracker(const ScanPolicy &policy,
				   std::size_t node_count,
				   PartitionFilter &filter)
	:PartitionTracker(policy, CheckFilter(filter).partitions, &filter, {},
			  filter.begin, filter.count, node_count)
{
	if (filter.partitions.empty()) {
		InitPartitions(filter.partitions, filter.count,
			       filter.digest ? &*filter.digest : nullptr);
		filter.retry = true;
	} else if (max_records == 0) {
		/* without a record limit, all partitions are queried
		   again */
		filter.retry = true;
	}
}

void
PartitionTracker::InitPartitions(std::vector<PartitionStatus> &dest,
				 unsigned count, const Digest *digest) const
{
	dest.clear();
	dest.reserve(count);

	for (unsigned i = 0; i < count; ++i)
		dest.emplace_back(partition_begin + i);

	if (digest != nullptr)
		dest.front().digest = *digest;
}

PartitionStatus &
PartitionTracker::GetPartition(unsigned partition_id)
{
	if (partition_id < partition_begin ||
	    partition_id - partition_begin >= partitions.size())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Partition {} is not part of this operation",
				      partition_id);

	return partitions[partition_id - partition_begin];
}

NodePartitions *
PartitionTracker::FindNode(std::vector<NodePartitions> &list,
			   const Node *node) noexcept
{
	for (auto &np : list)
		if (np.node.get() == node)
			return &np;

	return nullptr;
}

std::vector<NodePartitions> &
PartitionTracker::AssignPartitionsToNodes(const Cluster &cluster,
					  std::string_view ns)
{
	const auto snapshot = cluster.GetSnapshot();
	const auto &map = *snapshot->partition_map;

	auto i = map.find(ns);
	if (i == map.end())
		throw InvalidNamespaceError(ns, map.size());

	const auto &master = i->second->replicas.front();

	std::vector<NodePartitions> list;
	list.reserve(node_capacity);

	const bool retry = (partition_filter == nullptr || partition_filter->retry) &&
		iteration == 1;

	for (auto &part : partitions) {
		if (!retry && !part.retry)
			continue;

		const std::shared_ptr<Node> node = part.id < master.size()
			? master[part.id]
			: nullptr;
		if (node == nullptr)
			throw InvalidNodeError(part.id);

		part.retry = false;

		/* compare names: during a transition, the map may
		   contain the old and the new instance of a node */
		if (!node_filter.empty() && node->GetName() != node_filter)
			continue;

		auto *np = FindNode(list, node.get());
		if (np == nullptr)
			/* a transitional map may result in more than one
			   unit for the same node name */
			np = &list.emplace_back(node, partitions_capacity);

		part.node = node;
		np->AddPartition(part);
	}

	if (list.empty())
		throw InvalidNodeError("No nodes were assigned");

	/* if this operation is aborted, then a reused filter must
	   query all partitions again; cleared by IsComplete() */
	if (partition_filter != nullptr)
		partition_filter->retry = true;

	if (max_records > 0) {
		std::size_t n = list.size();

		/* only nodes with at least one requested record */
		if (std::size_t(max_records) < n) {
			n = max_records;
			list.erase(std::next(list.begin(), n), list.end());
		}

		const uint64_t max = max_records / n;
		const std::size_t rem = max_records - max * n;

		for (std::size_t j = 0; j < n; ++j)
			list[j].record_max = j < rem ? max + 1 : max;
	}

	node_partitions_list = std::move(list);
	return node_partitions_list;
}

void
PartitionTracker::PartitionUnavailable(NodePartitions &np,
				       unsigned partition_id)
{
	GetPartition(partition_id).retry = true;
	++np.parts_unavailable;
}

bool
PartitionTracker::AllowRecord(NodePartitions &np) noexcept
{
	if (np.record_max > 0 && np.record_count >= np.record_max)
		return false;

	++np.record_count;
	return true;
}

void
PartitionTracker::SetLast(NodePartitions &, const Digest &digest,
			  uint64_t bval)
{
	auto &ps = GetPartition(GetPartitionId(digest));
	ps.digest = digest;
	ps.bval = bval;
}

void
PartitionTracker::MarkRetry(NodePartitions &np) noexcept
{
	for (auto *ps : np.parts_full)
		ps->retry = true;

	for (auto *ps : np.parts_partial)
		ps->retry = true;
}

bool
PartitionTracker::IsComplete(const Cluster &cluster)
{
	uint64_t record_count = 0;
	unsigned parts_unavailable = 0;

	for (const auto &np : node_partitions_list) {
		record_count += np.record_count;
		parts_unavailable += np.parts_unavailable;
	}

	if (parts_unavailable == 0) {
		if (max_records == 0) {
			if (partition_filter != nullptr)
				partition_filter->done = true;
		} else if (iteration > 1) {
			/* only the partitions of failed nodes were
			   queried in the last round; a reused filter must
			   query all of them again */
			if (partition_filter != nullptr) {
				partition_filter->retry = true;
				partition_filter->done = false;
			}
		} else if (cluster.HasPartitionQuery()) {
			/* a node which has delivered its maximum may
			   have more records */
			bool done = true;

			for (auto &np : node_partitions_list) {
				if (np.record_count >= np.record_max) {
					MarkRetry(np);
					done = false;
				}
			}

			if (partition_filter != nullptr) {
				partition_filter->retry = false;
				partition_filter->done = done;
			}
		} else {
			/* older servers may deliver fewer records than
			   requested; a node is only drained if it has
			   delivered nothing */
			for (auto &np : node_partitions_list)
				if (np.record_count > 0)
					MarkRetry(np);

			if (partition_filter != nullptr) {
				partition_filter->retry = false;
				partition_filter->done = record_count == 0;
			}
		}

		return true;
	}

	if (max_records > 0 && record_count >= uint64_t(max_records))
		return true;

	if (iteration > max_retries) {
		std::string msg = fmt::format("Max retries exceeded: {}\n",
					      max_retries);

		const std::scoped_lock lock{mutex};
		if (!errors.empty()) {
			msg += "sub-exceptions:\n";

			for (const auto &i : errors) {
				msg += i;
				msg.push_back('\n');
			}
		}

		throw ClusterError(ResultCode::MAX_RETRIES_EXCEEDED, msg);
	}

	if (has_deadline) {
		const auto remaining =
			std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now()) -
			sleep_between_retries;

		if (remaining.count() <= 0)
			throw FmtClusterError(ResultCode::TIMEOUT,
					      "Client timeout: iteration={} socket={} total={} maxRetries={}",
					      iteration, socket_timeout.count(),
					      total_timeout.count(), max_retries);

		if (remaining < total_timeout) {
			total_timeout = remaining;

			if (socket_timeout > total_timeout)
				socket_timeout = total_timeout;
		}
	}

	if (max_records > 0)
		max_records -= record_count;

	++iteration;
	return false;
}

bool
PartitionTracker::ShouldRetry(NodePartitions &np, const ClusterError &error)
{
	if (!error.IsRetryable())
		return false;

	{
		const std::scoped_lock lock{mutex};
		errors.emplace_back(error.what());
	}

	MarkRetry(np);
	np.parts_unavailable = np.GetPartitionCount();
	return true;
}

void
PartitionTracker::PartitionError() noexcept
{
	if (partition_filter != nullptr)
		partition_filter->retry = true;
}
