// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Host.hxx"
#include "Features.hxx"
#include "PutAction.hxx"
#include "RackParser.hxx"
#include "Logger.hxx"

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class Cluster;
class Connection;
class ConnectionPool;
class NodeValidator;
class PartitionMapBuilder;
struct Peers;
struct NodeStats;

class Node;

/**
 * A connection borrowed from a #Node's pool.  It must be given
 * back with Release(); if the lease is destroyed without that, the
 * connection is closed.
 */
class ConnectionLease {
	std::shared_ptr<Node> node;
	unsigned pool_index;
	std::unique_ptr<Connection> connection;

public:
	ConnectionLease(std::shared_ptr<Node> _node, unsigned _pool_index,
			std::unique_ptr<Connection> _connection) noexcept;

	ConnectionLease(ConnectionLease &&) noexcept = default;
	ConnectionLease &operator=(ConnectionLease &&) = delete;

	~ConnectionLease() noexcept;

	Node &GetNode() const noexcept {
		return *node;
	}

	Connection &operator*() const noexcept {
		return *connection;
	}

	Connection *operator->() const noexcept {
		return connection.get();
	}

	/**
	 * Return the connection to the pool (if it may be reused and
	 * the node is still active) or close it.
	 */
	void Release(PutAction action) noexcept;
};

/**
 * A server in the cluster.  It is created by the tend thread after
 * a #NodeValidator has succeeded and stays alive as long as it is
 * referenced by a snapshot or by a #ConnectionLease.  A node which
 * has been removed from the cluster is never reused; if the server
 * comes back, a new instance is created.
 */
class Node final : public std::enable_shared_from_this<Node> {
	friend class ConnectionLease;

	Cluster &cluster;

	const std::string name;

	/**
	 * The host which was validated (as configured or announced).
	 */
	const Host host;

	/**
	 * The numeric address which was validated.
	 */
	const Host address;

	/**
	 * Bit mask of #NodeFeature values.
	 */
	const unsigned features;

	const Logger logger;

	/**
	 * The connection used by the tend thread for info requests.
	 */
	std::unique_ptr<Connection> tend_connection;

	std::vector<std::unique_ptr<ConnectionPool>> pools;

	/**
	 * Rotating start index for choosing a pool.
	 */
	std::atomic_uint pool_index{0};

	std::atomic_ulong n_opened{0}, n_closed{0};

	/**
	 * Connection errors in the current error rate window.
	 */
	std::atomic_uint error_count{0};

	std::atomic_bool active{true};

	/**
	 * The number of consecutive refresh failures.  Only the tend
	 * thread modifies it.
	 */
	std::atomic_uint failures{0};

	/**
	 * The rack of this node in each namespace.  Replaced by the
	 * tend thread, read by routing.  Null until the first
	 * successful RefreshRacks().
	 */
	std::atomic<std::shared_ptr<const RackMap>> racks;

public:
	/* the following fields are only accessed by the tend thread */

	/**
	 * Numeric addresses and announced names of this node.
	 */
	std::vector<Host> aliases;

	int64_t peers_generation = -1;
	int64_t partition_generation = -1;

	/**
	 * The number of peers in the last peers response.
	 */
	unsigned peers_count = 0;

	/**
	 * How many other nodes list this one as peer (counted in the
	 * current tend cycle).
	 */
	unsigned reference_count = 0;

	bool partition_changed = true;

	int64_t rebalance_generation = -1;
	bool rebalance_changed = false;

	Node(Cluster &_cluster, NodeValidator &&nv);
	~Node() noexcept;

	Node(const Node &) = delete;
	Node &operator=(const Node &) = delete;

	const std::string &GetName() const noexcept {
		return name;
	}

	const Host &GetHost() const noexcept {
		return host;
	}

	const Host &GetAddress() const noexcept {
		return address;
	}

	unsigned GetFeatures() const noexcept {
		return features;
	}

	bool HasFeature(NodeFeature feature) const noexcept {
		return ::HasFeature(features, feature);
	}

	bool HasPeers() const noexcept {
		return HasFeature(NodeFeature::PEERS);
	}

	/**
	 * May be called from any thread.
	 */
	bool IsActive() const noexcept {
		return active.load(std::memory_order_relaxed);
	}

	/**
	 * May be called from any thread.
	 */
	unsigned GetFailures() const noexcept {
		return failures.load(std::memory_order_relaxed);
	}

	/**
	 * Is this node on the given rack in the given namespace?
	 * May be called from any thread.
	 */
	bool HasRack(std::string_view ns, unsigned rack_id) const noexcept;

	/**
	 * Mark the node inactive.  Routing will skip it and returned
	 * connections are closed.
	 */
	void Deactivate() noexcept {
		active.store(false, std::memory_order_relaxed);
	}

	/**
	 * Request name, generations (and, without peers support, the
	 * service list) from the server and compare them with the
	 * known values.  Errors are counted, not thrown.
	 */
	void Refresh(Peers &peers) noexcept;

	/**
	 * Fetch the peer list and validate peers which are not yet
	 * part of the cluster.  Errors are counted, not thrown.
	 */
	void RefreshPeers(Peers &peers) noexcept;

	/**
	 * Fetch the replica ownership and apply it to the map builder.
	 * Errors are counted, not thrown.
	 */
	void RefreshPartitions(const Peers &peers,
			       PartitionMapBuilder &builder) noexcept;

	/**
	 * Fetch the rack ids of all namespaces.  Errors are counted,
	 * not thrown.
	 */
	void RefreshRacks() noexcept;

	/**
	 * Open the configured minimum number of connections.  Errors
	 * are logged.
	 */
	void CreateMinConnections() noexcept;

	/**
	 * Close surplus idle connections and open missing ones.
	 */
	void BalanceConnections() noexcept;

	/**
	 * Borrow a connection, opening a new one if no idle connection
	 * is available.
	 *
	 * Throws #ClusterError on error.
	 */
	ConnectionLease GetConnection();

	/**
	 * Count a connection error for the error rate limit.
	 */
	void AddError() noexcept {
		error_count.fetch_add(1, std::memory_order_relaxed);
	}

	unsigned GetErrorCount() const noexcept {
		return error_count.load(std::memory_order_relaxed);
	}

	void ResetErrorCount() noexcept {
		error_count.store(0, std::memory_order_relaxed);
	}

	/**
	 * Is the error rate within the configured limit?
	 */
	[[gnu::pure]]
	bool IsErrorRateWithinLimit() const noexcept;

	/**
	 * Deactivate the node and close all connections.
	 */
	void Close() noexcept;

	[[gnu::pure]]
	NodeStats GetStats() const noexcept;

	/**
	 * Format as "NAME HOST PORT".
	 */
	[[gnu::pure]]
	std::string ToString() const noexcept;

private:
	std::unique_ptr<Connection> CreateConnection();
	void CloseTendConnection() noexcept;
	void RefreshFailed(std::exception_ptr ep) noexcept;
	void Restart() noexcept;
	void AddFriends(const std::string &services, Peers &peers);
	void PrepareFriend(const Host &friend_host, Peers &peers);
	bool FindPeerNode(Peers &peers, std::string_view peer_name) noexcept;
	void Put(unsigned idx, std::unique_ptr<Connection> connection,
		 PutAction action) noexcept;
};
