// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Node.hxx"
#include "Cluster.hxx"
#include "Config.hxx"
#include "Connection.hxx"
#include "ConnectionPool.hxx"
#include "Error.hxx"
#include "Info.hxx"
#include "NodeValidator.hxx"
#include "PartitionParser.hxx"
#include "Partitions.hxx"
#include "PeerParser.hxx"
#include "Peers.hxx"
#include "Stats.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <algorithm>

ConnectionLease::ConnectionLease(std::shared_ptr<Node> _node,
				 unsigned _pool_index,
				 std::unique_ptr<Connection> _connection) noexcept
	:node(std::move(_node)), pool_index(_pool_index),
	 connection(std::move(_connection))
{
}

ConnectionLease::~ConnectionLease() noexcept
{
	if (connection)
		Release(PutAction::DESTROY);
}

void
ConnectionLease::Release(PutAction action) noexcept
{
	node->Put(pool_index, std::move(connection), action);
	node.reset();
}

Node::Node(Cluster &_cluster, NodeValidator &&nv)
	:cluster(_cluster),
	 name(std::move(nv.name)),
	 host(nv.primary_host),
	 address(nv.primary_address),
	 features(nv.features),
	 logger(fmt::format("node {} {}", name, host)),
	 tend_connection(std::move(nv.connection)),
	 n_opened(1),
	 aliases(std::move(nv.aliases))
{
	const auto &config = cluster.config;

	/* split min/max evenly; the first pools get the
	   remainder */
	const unsigned n = std::max(config.connection_pools, 1U);
	const unsigned min_size = config.min_connections / n;
	const unsigned min_rem = config.min_connections % n;
	const unsigned max_size = config.max_connections / n;
	const unsigned max_rem = config.max_connections % n;

	pools.reserve(n);
	for (unsigned i = 0; i < n; ++i)
		pools.emplace_back(std::make_unique<ConnectionPool>(min_size + (i < min_rem),
								    max_size + (i < max_rem)));
}

Node::~Node() noexcept = default;

std::string
Node::ToString() const noexcept
{
	return fmt::format("{} {}", name, host);
}

std::unique_ptr<Connection>
Node::CreateConnection()
{
	const auto &config = cluster.config;

	if (!IsErrorRateWithinLimit())
		throw FmtClusterError(ResultCode::MAX_ERROR_RATE,
				      "Max error rate exceeded: node {}",
				      ToString());

	auto c = cluster.connector.Connect(address, config.connect_timeout);
	n_opened.fetch_add(1, std::memory_order_relaxed);

	if (config.IsAuthEnabled()) {
		try {
			cluster.connector.Login(*c, config);
		} catch (...) {
			c->Close();
			n_closed.fetch_add(1, std::memory_order_relaxed);
			throw;
		}
	}

	return c;
}

void
Node::CloseTendConnection() noexcept
{
	if (tend_connection == nullptr)
		return;

	tend_connection->Close();
	tend_connection.reset();
	n_closed.fetch_add(1, std::memory_order_relaxed);
}

static int64_t
GetInfoInteger(const InfoMap &map, std::string_view name)
{
	return ParseInfoInteger(name, GetInfoValue(map, name));
}

void
Node::Refresh(Peers &peers) noexcept
{
	if (!IsActive())
		return;

	const auto &config = cluster.config;

	try {
		if (tend_connection == nullptr || !tend_connection->IsValid()) {
			CloseTendConnection();
			tend_connection = CreateConnection();
		}

		const char *const services_command = config.use_services_alternate
			? "services-alternate"
			: "services";

		std::vector<std::string_view> commands{"node"};
		if (peers.use_peers)
			commands.emplace_back("peers-generation");
		commands.emplace_back("partition-generation");
		if (!peers.use_peers)
			commands.emplace_back(services_command);
		if (config.rack_aware)
			commands.emplace_back("rebalance-generation");

		const InfoMap map = InfoRequest(*tend_connection, commands);

		const auto &info_name = GetInfoValue(map, "node");
		if (info_name != name) {
			/* another server has taken over this address */
			Deactivate();
			throw FmtClusterError(ResultCode::INVALID_NODE_ERROR,
					      "Node name has changed. Old={} New={}",
					      name, info_name);
		}

		if (peers.use_peers) {
			const auto gen = GetInfoInteger(map, "peers-generation");
			if (gen != peers_generation) {
				peers.gen_changed = true;

				if (peers_generation > gen) {
					logger.Fmt(5, "Quick node restart detected: node={} oldgen={} newgen={}",
						   ToString(), peers_generation, gen);
					Restart();
				}
			}
		}

		if (GetInfoInteger(map, "partition-generation") != partition_generation)
			partition_changed = true;

		if (config.rack_aware &&
		    GetInfoInteger(map, "rebalance-generation") != rebalance_generation)
			rebalance_changed = true;

		if (!peers.use_peers) {
			auto i = map.find(services_command);
			AddFriends(i != map.end() ? i->second : std::string{}, peers);
		}

		++peers.refresh_count;

		if (failures > 0) {
			/* recovered: the peers and partitions may have
			   changed meanwhile */
			peers.gen_changed = true;
			partition_changed = true;
			rebalance_changed = config.rack_aware;
		}

		failures = 0;
	} catch (...) {
		if (peers.use_peers)
			peers.gen_changed = true;

		RefreshFailed(std::current_exception());
	}
}

void
Node::Restart() noexcept
{
	ResetErrorCount();

	const auto &config = cluster.config;
	if (config.IsAuthEnabled() && tend_connection != nullptr) {
		try {
			cluster.connector.Login(*tend_connection, config);
		} catch (...) {
			logger(4, "Node restart failed: ", std::current_exception());
			CloseTendConnection();
			return;
		}
	}

	BalanceConnections();
}

void
Node::AddFriends(const std::string &services, Peers &peers)
{
	if (services.empty()) {
		peers_count = 0;
		return;
	}

	const auto hosts = ParseServiceHosts(services);
	peers_count = hosts.size();

	const auto &config = cluster.config;

	for (const auto &i : hosts) {
		const Host friend_host(config.MapAddress(i.name), i.port);

		if (auto *node = cluster.FindAlias(friend_host))
			++node->reference_count;
		else if (peers.hosts.find(friend_host) == peers.hosts.end())
			PrepareFriend(friend_host, peers);
	}
}

void
Node::PrepareFriend(const Host &friend_host, Peers &peers)
{
	try {
		NodeValidator nv(cluster.config, cluster.connector, logger);
		nv.ValidateNode(friend_host);

		if (auto i = peers.nodes.find(nv.name); i != peers.nodes.end()) {
			/* the service list contains more than one
			   address of this node */
			nv.connection->Close();
			peers.hosts.emplace(friend_host);
			i->second->aliases.push_back(friend_host);
			return;
		}

		if (auto *node = cluster.FindNodeByName(nv.name)) {
			nv.connection->Close();
			peers.hosts.emplace(friend_host);
			node->aliases.push_back(friend_host);
			++node->reference_count;
			cluster.AddAlias(friend_host, *node);
			return;
		}

		auto node = cluster.CreateNode(std::move(nv));
		peers.hosts.emplace(friend_host);
		peers.nodes.emplace(node->GetName(), std::move(node));
	} catch (...) {
		peers.Fail(friend_host);
		logger.Fmt(4, "Add node {} failed: {}", friend_host,
			   GetFullMessage(std::current_exception()));
	}
}

bool
Node::FindPeerNode(Peers &peers, std::string_view peer_name) noexcept
{
	if (auto *node = cluster.FindNodeByName(peer_name)) {
		++node->reference_count;
		return true;
	}

	if (auto i = peers.nodes.find(peer_name); i != peers.nodes.end()) {
		++i->second->reference_count;
		return true;
	}

	return false;
}

void
Node::RefreshPeers(Peers &peers) noexcept
{
	/* skip nodes which have failed in this cycle */
	if (failures > 0 || !IsActive())
		return;

	const auto &config = cluster.config;

	try {
		logger(6, "Update peers");

		const std::string_view command = GetPeersCommand(config);
		const auto response = InfoRequest(*tend_connection, command);
		const auto generation = ParsePeers(response, config, peers.peers);
		peers_count = peers.peers.size();

		bool peers_validated = true;

		for (const auto &peer : peers.peers) {
			if (FindPeerNode(peers, peer.node_name))
				continue;

			bool node_validated = false;

			for (const auto &i : peer.hosts) {
				if (peers.HasFailed(i))
					continue;

				try {
					NodeValidator nv(config, cluster.connector,
							 logger);
					nv.ValidateNode(i);

					if (nv.name != peer.node_name) {
						logger.Fmt(4, "Peer node {} is different than actual node {} for host {}",
							   peer.node_name, nv.name, i);

						if (FindPeerNode(peers, nv.name)) {
							nv.connection->Close();
							node_validated = true;
							break;
						}
					}

					auto node = cluster.CreateNode(std::move(nv));
					peers.nodes.emplace(node->GetName(),
							    std::move(node));
					node_validated = true;
					break;
				} catch (...) {
					peers.Fail(i);
					logger.Fmt(4, "Add node {} failed: {}", i,
						   GetFullMessage(std::current_exception()));
				}
			}

			if (!node_validated)
				peers_validated = false;
		}

		/* only remember the generation if all peers have been
		   found, so the next cycle retries the others */
		if (peers_validated)
			peers_generation = generation;

		++peers.refresh_count;
	} catch (...) {
		RefreshFailed(std::current_exception());
	}
}

void
Node::RefreshPartitions(const Peers &peers,
			PartitionMapBuilder &builder) noexcept
{
	/* a node without peers in a cluster of several nodes is
	   probably isolated; its table cannot be trusted */
	if (failures > 0 || !IsActive() ||
	    (peers_count == 0 && peers.refresh_count > 1))
		return;

	try {
		logger(6, "Update partition map");

		const std::string_view replicas_command = GetReplicasCommand(*this);
		const InfoMap map = InfoRequest(*tend_connection,
						{"partition-generation", replicas_command});

		const auto generation = GetInfoInteger(map, "partition-generation");

		auto i = map.find(replicas_command);
		if (i == map.end())
			throw FmtClusterError(ResultCode::PARSE_ERROR,
					      "{} response is missing",
					      replicas_command);

		ParsePartitions(i->second, HasFeature(NodeFeature::REPLICAS),
				*this, builder, logger);
		partition_generation = generation;
	} catch (...) {
		RefreshFailed(std::current_exception());
	}
}

void
Node::RefreshRacks() noexcept
{
	if (failures > 0 || !IsActive())
		return;

	try {
		logger(6, "Update racks");

		const InfoMap map = InfoRequest(*tend_connection,
						{"rebalance-generation", "rack-ids"});

		const auto generation = GetInfoInteger(map, "rebalance-generation");

		auto i = map.find("rack-ids");
		if (i == map.end())
			throw ClusterError(ResultCode::PARSE_ERROR,
					   "rack-ids response is missing");

		racks.store(std::make_shared<const RackMap>(ParseRacks(i->second)));
		rebalance_generation = generation;
	} catch (...) {
		RefreshFailed(std::current_exception());
	}
}

bool
Node::HasRack(std::string_view ns, unsigned rack_id) const noexcept
{
	const auto map = racks.load();
	if (map == nullptr)
		return false;

	auto i = map->find(ns);
	return i != map->end() && i->second == rack_id;
}

void
Node::RefreshFailed(std::exception_ptr ep) noexcept
{
	++failures;
	CloseTendConnection();
	AddError();

	/* no log spam while the cluster is being closed */
	if (cluster.IsTendValid())
		logger(4, "Node refresh failed: ", ep);
}

void
Node::CreateMinConnections() noexcept
{
	for (auto &pool : pools) {
		for (unsigned n = pool->GetMinSize(); n > 0; --n) {
			if (!pool->Reserve())
				break;

			try {
				pool->Push(CreateConnection());
			} catch (...) {
				pool->Unreserve();
				logger(6, "Failed to create minimum connections: ",
				       std::current_exception());
				return;
			}
		}
	}
}

void
Node::BalanceConnections() noexcept
{
	const auto max_idle = cluster.config.max_socket_idle;

	for (auto &pool : pools) {
		for (unsigned missing = pool->Trim(max_idle); missing > 0; --missing) {
			if (!pool->Reserve())
				break;

			try {
				pool->Push(CreateConnection());
			} catch (...) {
				pool->Unreserve();
				logger(6, "Failed to create minimum connections: ",
				       std::current_exception());
				return;
			}
		}
	}
}

ConnectionLease
Node::GetConnection()
{
	if (!IsActive())
		throw FmtClusterError(ResultCode::SERVER_NOT_AVAILABLE,
				      "Node {} is not active", ToString());

	const auto max_idle = cluster.config.max_socket_idle;
	const unsigned n = pools.size();
	const unsigned start = pool_index.fetch_add(1, std::memory_order_relaxed);

	for (unsigned i = 0; i < n; ++i) {
		const unsigned idx = (start + i) % n;
		auto &pool = *pools[idx];

		if (auto c = pool.PopIdle(max_idle))
			return {shared_from_this(), idx, std::move(c)};

		if (pool.Reserve()) {
			try {
				return {shared_from_this(), idx, CreateConnection()};
			} catch (...) {
				pool.Unreserve();
				AddError();
				throw;
			}
		}
	}

	throw FmtClusterError(ResultCode::NO_MORE_CONNECTIONS,
			      "Node {} max connections {} would be exceeded",
			      ToString(), cluster.config.max_connections);
}

void
Node::Put(unsigned idx, std::unique_ptr<Connection> connection,
	  PutAction action) noexcept
{
	auto &pool = *pools[idx];

	if (action == PutAction::REUSE && IsActive())
		pool.Push(std::move(connection));
	else
		pool.Discard(std::move(connection));
}

bool
Node::IsErrorRateWithinLimit() const noexcept
{
	const unsigned max_error_rate = cluster.config.max_error_rate;
	return max_error_rate == 0 || GetErrorCount() <= max_error_rate;
}

void
Node::Close() noexcept
{
	Deactivate();
	CloseTendConnection();

	for (auto &pool : pools)
		pool->Close();
}

NodeStats
Node::GetStats() const noexcept
{
	NodeStats stats;
	stats.name = name;
	stats.host = host.ToString();
	stats.opened = n_opened.load(std::memory_order_relaxed);
	stats.closed = n_closed.load(std::memory_order_relaxed);
	stats.error_count = GetErrorCount();
	stats.active = IsActive();

	for (const auto &pool : pools) {
		const auto s = pool->GetStats();
		stats.in_use += s.in_use;
		stats.in_pool += s.in_pool;
		stats.closed += s.closed;
	}

	return stats;
}
