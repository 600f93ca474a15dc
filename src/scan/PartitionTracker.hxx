// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "NodePartitions.hxx"
#include "PartitionStatus.hxx"
#include "ScanPolicy.hxx"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

class Cluster;
class ClusterError;
struct PartitionFilter;

/**
 * Keeps track of the progress of a scan/query across all partitions
 * and decides which partitions must be retried on which node in the
 * next round.
 *
 * AssignPartitionsToNodes(), IsComplete() and PartitionError() are
 * called by the thread which drives the operation; the per-record
 * methods and ShouldRetry() are called by the worker which executes
 * the unit in question.
 */
class PartitionTracker {
	using clock_type = std::chrono::steady_clock;

	/**
	 * The partitions of this operation if there is no
	 * #PartitionFilter.
	 */
	std::vector<PartitionStatus> own_partitions;

	/**
	 * Points to #own_partitions or to PartitionFilter::partitions.
	 */
	std::vector<PartitionStatus> &partitions;

	PartitionFilter *const partition_filter;

	/**
	 * If not empty, then only partitions owned by the node with
	 * this name are queried.
	 */
	const std::string node_filter;

	const unsigned partition_begin;

	/**
	 * The expected number of partitions per node.
	 */
	const unsigned partitions_capacity;

	const std::size_t node_capacity;

	std::vector<NodePartitions> node_partitions_list;

	/**
	 * Protects #errors.
	 */
	std::mutex mutex;

	/**
	 * Messages of the retryable errors of all rounds.
	 */
	std::vector<std::string> errors;

	clock_type::time_point deadline;

	std::chrono::milliseconds socket_timeout, total_timeout;
	const std::chrono::milliseconds sleep_between_retries;

	int64_t max_records;

	const unsigned max_retries;

	/**
	 * Is #deadline set?
	 */
	bool has_deadline = false;

	unsigned iteration = 1;

public:
	/**
	 * Query all partitions of all nodes.
	 *
	 * Throws #ClusterError (PARAMETER_ERROR) if the policy is
	 * invalid.
	 */
	PartitionTracker(const ScanPolicy &policy, std::size_t node_count);

	/**
	 * Query all partitions owned by the given node.
	 */
	PartitionTracker(const ScanPolicy &policy, std::string_view node_name);

	/**
	 * Query the partitions selected by the filter.  The filter
	 * must outlive this object; it collects the progress.
	 *
	 * Throws #ClusterError (PARAMETER_ERROR) if the filter or the
	 * policy is invalid.
	 */
	PartitionTracker(const ScanPolicy &policy, std::size_t node_count,
			 PartitionFilter &filter);

	PartitionTracker(const PartitionTracker &) = delete;
	PartitionTracker &operator=(const PartitionTracker &) = delete;

	unsigned GetIteration() const noexcept {
		return iteration;
	}

	std::chrono::milliseconds GetSocketTimeout() const noexcept {
		return socket_timeout;
	}

	std::chrono::milliseconds GetTotalTimeout() const noexcept {
		return total_timeout;
	}

	std::chrono::milliseconds GetSleepBetweenRetries() const noexcept {
		return sleep_between_retries;
	}

	int64_t GetMaxRecords() const noexcept {
		return max_records;
	}

	const std::vector<PartitionStatus> &GetPartitions() const noexcept {
		return partitions;
	}

	/**
	 * Begin a new round: assign each partition which needs to be
	 * (re)queried to the current master node of the partition.
	 * The returned list remains valid until the next call.
	 *
	 * Throws #ClusterError (INVALID_NAMESPACE or
	 * INVALID_NODE_ERROR).
	 */
	std::vector<NodePartitions> &AssignPartitionsToNodes(const Cluster &cluster,
							     std::string_view ns);

	/**
	 * The server has reported that it cannot deliver the given
	 * partition; it will be retried in the next round.
	 */
	void PartitionUnavailable(NodePartitions &np, unsigned partition_id);

	/**
	 * May another record be delivered from this unit?  If yes, it
	 * is counted.
	 */
	bool AllowRecord(NodePartitions &np) noexcept;

	/**
	 * Remember the position of the most recent record of a
	 * partition.
	 */
	void SetLast(NodePartitions &np, const Digest &digest, uint64_t bval);

	/**
	 * Evaluate the round which has just finished.
	 *
	 * @return true if the operation is finished, false if another
	 * round is needed
	 *
	 * Throws #ClusterError (MAX_RETRIES_EXCEEDED or TIMEOUT).
	 */
	bool IsComplete(const Cluster &cluster);

	/**
	 * A unit has failed.  If the error is retryable, then all of
	 * the unit's partitions are marked for retry and this method
	 * returns true; the caller shall not report the error.
	 */
	bool ShouldRetry(NodePartitions &np, const ClusterError &error);

	/**
	 * The operation has failed; the filter must query all
	 * partitions again if it is reused.
	 */
	void PartitionError() noexcept;

private:
	PartitionTracker(const ScanPolicy &policy,
			 std::vector<PartitionStatus> &_partitions,
			 PartitionFilter *filter, std::string_view node_name,
			 unsigned begin, unsigned _partitions_capacity,
			 std::size_t _node_capacity);

	void InitPartitions(std::vector<PartitionStatus> &dest,
			    unsigned count, const Digest *digest) const;

	PartitionStatus &GetPartition(unsigned partition_id);

	NodePartitions *FindNode(std::vector<NodePartitions> &list,
				 const Node *node) noexcept;

	void MarkRetry(NodePartitions &np) noexcept;
};
