// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "PartitionTracker.hxx"

#include <string>

class Cluster;
class PartitionCommand;
struct PartitionFilter;

/**
 * Drives a scan or query: in each round, the #PartitionTracker
 * assigns the pending partitions to nodes, and each unit is executed
 * by the cluster's worker pool.  The first non-retryable error
 * cancels the other units of the round.
 */
class ScanDriver {
	Cluster &cluster;

	PartitionCommand &command;

	const std::string ns;

	PartitionTracker tracker;

public:
	/**
	 * Throws #ClusterError (PARAMETER_ERROR) if the policy is
	 * invalid.
	 */
	ScanDriver(Cluster &_cluster, const ScanPolicy &policy,
		   std::string_view _ns, PartitionCommand &_command);

	/**
	 * Scan only the partitions owned by the named node.
	 */
	ScanDriver(Cluster &_cluster, const ScanPolicy &policy,
		   std::string_view _ns, std::string_view node_name,
		   PartitionCommand &_command);

	/**
	 * Scan the partitions selected by the filter, which collects
	 * the progress and must outlive this object.
	 *
	 * Throws #ClusterError (PARAMETER_ERROR) if the filter is
	 * invalid.
	 */
	ScanDriver(Cluster &_cluster, const ScanPolicy &policy,
		   std::string_view _ns, PartitionFilter &filter,
		   PartitionCommand &_command);

	const PartitionTracker &GetTracker() const noexcept {
		return tracker;
	}

	/**
	 * Run rounds until all partitions are complete.
	 *
	 * Throws #ClusterError on error.
	 */
	void Run();

private:
	/**
	 * Execute all units of one round.
	 *
	 * Throws the first non-retryable error.
	 */
	void RunRound(std::vector<NodePartitions> &units);
};
