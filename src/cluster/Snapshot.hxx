// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Partitions.hxx"
#include "Features.hxx"

#include <memory>
#include <vector>

/**
 * The state of the cluster as seen by application threads: the
 * node list and the partition map of one tend cycle.  It is never
 * modified after publication; the tend thread publishes a new
 * instance with one atomic pointer store.
 */
struct ClusterSnapshot {
	std::vector<std::shared_ptr<Node>> nodes;

	std::shared_ptr<const PartitionMap> partition_map =
		std::make_shared<const PartitionMap>();

	/**
	 * The features supported by all nodes (bit mask of
	 * #NodeFeature values).
	 */
	unsigned features = 0;

	bool HasFeature(NodeFeature feature) const noexcept {
		return ::HasFeature(features, feature);
	}
};
