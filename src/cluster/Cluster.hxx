// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Config.hxx"
#include "Snapshot.hxx"
#include "Partition.hxx"
#include "Logger.hxx"
#include "thread_pool.hxx"
#include "scan/CancellationToken.hxx"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

class Connector;
class Node;
class NodeValidator;
struct Peers;
struct ClusterStats;
class TendLoop;

/**
 * The client's view of a cluster: the list of nodes and the
 * partition map, kept up to date by a background "tend" thread.
 *
 * Application threads may call the routing methods concurrently
 * with the tend thread; they obtain the current #ClusterSnapshot
 * once and work with it.
 */
class Cluster {
	friend class Node;
	friend class TendLoop;

	const ClusterConfig config;

	Connector &connector;

	const Logger logger;

	std::atomic<std::shared_ptr<const std::vector<Host>>> seeds;

	std::atomic<std::shared_ptr<const ClusterSnapshot>> snapshot;

	/* the following two maps are only accessed by the tend
	   thread */

	/**
	 * All nodes of the current snapshot by name.
	 */
	std::map<std::string, std::shared_ptr<Node>, std::less<>> nodes_map;

	/**
	 * All known addresses of nodes of the current snapshot.
	 */
	std::unordered_map<Host, std::shared_ptr<Node>, Host::Hash> aliases;

	/**
	 * Rotating indexes for GetRandomNode() and
	 * GetMasterProlesNode().
	 */
	mutable std::atomic_uint node_index{0}, replica_index{0};

	mutable std::atomic_uint invalid_node_count{0};

	std::atomic_ulong tend_count{0};

	/**
	 * Serializes tend cycles.
	 */
	std::mutex tend_mutex;

	/**
	 * Cleared by Close(); the tend loop exits.
	 */
	std::atomic_bool tend_valid{true};

	std::atomic_bool closed{false};

	/**
	 * Protects #tend_loop.
	 */
	std::mutex tend_loop_mutex;

	/**
	 * The event loop of the tend thread while it runs.
	 */
	TendLoop *tend_loop = nullptr;

	std::thread tend_thread;

	/**
	 * Executes the units of scans and queries.
	 */
	WorkerPool worker_pool;

	/**
	 * Cancelled by Close(); running scans observe it.
	 */
	CancellationToken close_token;

public:
	/**
	 * Does not connect yet; call Start() or Tend().
	 *
	 * Throws if the configuration is invalid.
	 */
	Cluster(const ClusterConfig &_config, Connector &_connector);

	~Cluster() noexcept;

	Cluster(const Cluster &) = delete;
	Cluster &operator=(const Cluster &) = delete;

	const ClusterConfig &GetConfig() const noexcept {
		return config;
	}

	const Logger &GetLogger() const noexcept {
		return logger;
	}

	/**
	 * Run tend cycles until the cluster is stable and launch the
	 * tend thread.
	 *
	 * Throws if the cluster cannot be reached and
	 * ClusterConfig::fail_if_not_connected is set.
	 */
	void Start();

	/**
	 * Run up to ClusterConfig::stabilize_cycles tend cycles until
	 * the node count stops changing; afterwards, the hosts of all
	 * nodes are added to the seed list.
	 *
	 * Throws on error if ClusterConfig::fail_if_not_connected is
	 * set.
	 */
	void WaitTillStabilized();

	/**
	 * Launch the background thread which runs Tend() periodically.
	 *
	 * Throws std::system_error if the thread cannot be created.
	 */
	void StartTendThread();

	/**
	 * Run one tend cycle.  Failures of single nodes are logged and
	 * counted; this method only throws if the seeds cannot be
	 * reached (which is never fatal here).
	 */
	void Tend();

	/**
	 * Wake up the tend thread to run a cycle now.  May be called
	 * from any thread.
	 */
	void InterruptTendSleep() noexcept;

	/**
	 * Stop the tend thread, cancel running scans and close all
	 * nodes.  May be called multiple times.
	 */
	void Close() noexcept;

	bool IsTendValid() const noexcept {
		return tend_valid.load(std::memory_order_relaxed);
	}

	std::shared_ptr<const ClusterSnapshot> GetSnapshot() const noexcept {
		return snapshot.load();
	}

	std::shared_ptr<const std::vector<Host>> GetSeeds() const noexcept {
		return seeds.load();
	}

	/**
	 * Append hosts to the seed list (copy-on-write).  Hosts which
	 * are already present are skipped.
	 */
	void AddSeeds(const std::vector<Host> &hosts) noexcept;

	/**
	 * Is there at least one active node which has not failed
	 * repeatedly?
	 */
	bool IsConnected() const noexcept;

	std::vector<std::shared_ptr<Node>> GetNodes() const noexcept {
		return GetSnapshot()->nodes;
	}

	std::vector<std::string> GetNodeNames() const noexcept;

	/**
	 * Find an active node by its name.
	 *
	 * Throws #ClusterError (INVALID_NODE_ERROR) if there is no
	 * such node.
	 */
	std::shared_ptr<Node> GetNode(std::string_view name) const;

	/**
	 * The master of the given partition.
	 *
	 * Throws #ClusterError (INVALID_NAMESPACE or
	 * INVALID_NODE_ERROR) if there is no active master.
	 */
	std::shared_ptr<Node> GetMasterNode(const Partition &partition) const;

	/**
	 * Pick master and replicas in turn.  If none of them is active,
	 * a random node is returned, unless the namespace is in strong
	 * consistency mode.
	 *
	 * Throws #ClusterError on error.
	 */
	std::shared_ptr<Node> GetMasterProlesNode(const Partition &partition) const;

	/**
	 * The first active node in replica priority order, with the
	 * same fallback as GetMasterProlesNode().
	 *
	 * Throws #ClusterError on error.
	 */
	std::shared_ptr<Node> GetSequenceNode(const Partition &partition) const;

	/**
	 * The first active replica which is on one of the racks in
	 * ClusterConfig::rack_ids, trying those racks in order.  If
	 * no replica is on any of these racks, the first active
	 * replica.
	 *
	 * Throws #ClusterError (INVALID_NODE_ERROR) if no replica is
	 * active.
	 */
	std::shared_ptr<Node> GetRackNode(const Partition &partition) const;

	/**
	 * Pick any active node (round robin).
	 *
	 * Throws #ClusterError (INVALID_NODE_ERROR) if there is none.
	 */
	std::shared_ptr<Node> GetRandomNode() const;

	/**
	 * Dispatch to one of the routing methods above.
	 */
	std::shared_ptr<Node> GetNodeForRead(ReplicaPolicy policy,
					     const Partition &partition) const;

	bool HasPartitionQuery() const noexcept {
		return GetSnapshot()->HasFeature(NodeFeature::PARTITION_QUERY);
	}

	bool SupportsDouble() const noexcept {
		return GetSnapshot()->HasFeature(NodeFeature::DOUBLE);
	}

	bool HasReplicasAll() const noexcept {
		return GetSnapshot()->HasFeature(NodeFeature::REPLICAS_ALL);
	}

	ClusterStats GetStats() const noexcept;

	unsigned long GetTendCount() const noexcept {
		return tend_count.load(std::memory_order_relaxed);
	}

	WorkerPool &GetWorkerPool() noexcept {
		return worker_pool;
	}

	/**
	 * Cancelled when the cluster is closed.
	 */
	const CancellationToken &GetCloseToken() const noexcept {
		return close_token;
	}

private:
	void TendCycle(bool fail_if_not_connected);

	/**
	 * Connect to the seeds and add the nodes found there.
	 *
	 * Throws #ClusterError (SERVER_NOT_AVAILABLE) if all seeds
	 * have failed and #fail_if_not_connected is set.
	 */
	void SeedNodes(bool fail_if_not_connected);

	void SeedNode(const Host &seed,
		      std::map<std::string, std::shared_ptr<Node>, std::less<>> &nodes_to_add);

	std::vector<std::shared_ptr<Node>> FindNodesToRemove(const ClusterSnapshot &current,
							     unsigned refresh_count,
							     const PartitionMap &partition_map) const noexcept;

	/**
	 * Publish a new snapshot: remove nodes, then add nodes, then
	 * replace the partition map.  Does nothing if there is no
	 * change.
	 */
	void Publish(const std::shared_ptr<const ClusterSnapshot> &current,
		     const std::vector<std::shared_ptr<Node>> &to_remove,
		     const std::map<std::string, std::shared_ptr<Node>, std::less<>> &to_add,
		     std::shared_ptr<const PartitionMap> partition_map) noexcept;

	void RunTendThread() noexcept;

	/**
	 * Called by the tend thread's timer.
	 */
	void OnTendTimer() noexcept;

	/* methods for class Node */

	std::shared_ptr<Node> CreateNode(NodeValidator &&nv);

	Node *FindNodeByName(std::string_view name) const noexcept;

	Node *FindAlias(const Host &host) const noexcept;

	void AddAlias(const Host &host, Node &node) noexcept;
};
