// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "cluster/Partition.hxx"

#include <cstdint>
#include <functional>
#include <string_view>

class Node;
class PartitionTracker;
class CancellationToken;
struct NodePartitions;

/**
 * Receives the records of a scan/query.  May be called from several
 * worker threads concurrently.
 *
 * @return false to stop the operation
 */
using RecordListener =
	std::function<bool(const Node &node, const Digest &digest,
			   std::string_view record)>;

/**
 * The node-specific part of a scan or query: send the request for
 * one #NodePartitions unit to its node and deliver the records.  The
 * #ScanDriver calls it from worker threads, one unit per call.
 */
class PartitionCommand {
public:
	virtual ~PartitionCommand() noexcept = default;

	/**
	 * Execute the request for all partitions of the given unit.
	 * Each record shall be passed to DeliverRecord(); partitions
	 * which the server cannot deliver shall be reported with
	 * PartitionTracker::PartitionUnavailable().
	 *
	 * Throws #ClusterError on error.
	 */
	virtual void Execute(Node &node, NodePartitions &unit,
			     PartitionTracker &tracker,
			     const CancellationToken &cancel) = 0;
};

/**
 * Pass one record to the listener and update the tracker.
 *
 * @return false if the unit has reached its record limit; the
 * command shall stop reading from this node
 *
 * Throws #ClusterError (SCAN_TERMINATED) if the operation was
 * cancelled or the listener has asked to stop.
 */
bool
DeliverRecord(const RecordListener &listener, PartitionTracker &tracker,
	      NodePartitions &unit, const CancellationToken &cancel,
	      const Digest &digest, uint64_t bval, std::string_view record);
