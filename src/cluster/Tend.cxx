// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Cluster.hxx"
#include "Node.hxx"
#include "NodeValidator.hxx"
#include "Connection.hxx"
#include "Error.hxx"
#include "Peers.hxx"
#include "event/Loop.hxx"
#include "event/TimerEvent.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>

/**
 * The event loop of the tend thread: a timer which fires every
 * tend interval.  Close() and InterruptTendSleep() activate the
 * timer from other threads.
 */
class TendLoop {
	Cluster &cluster;

	EventLoop event_loop;

	void OnTimer() noexcept;

	TimerEvent<TendLoop, &TendLoop::OnTimer> timer;

public:
	explicit TendLoop(Cluster &_cluster)
		:cluster(_cluster), timer(event_loop, *this) {}

	void Run() noexcept {
		timer.Schedule(cluster.config.tend_interval);
		event_loop.Dispatch();
	}

	void Wake() noexcept {
		timer.Trigger();
	}
};

void
TendLoop::OnTimer() noexcept
{
	if (!cluster.IsTendValid()) {
		event_loop.Break();
		return;
	}

	cluster.OnTendTimer();

	if (cluster.IsTendValid())
		timer.Schedule(cluster.config.tend_interval);
	else
		event_loop.Break();
}

void
Cluster::StartTendThread()
{
	tend_thread = std::thread([this]{ RunTendThread(); });
}

void
Cluster::RunTendThread() noexcept
{
	std::unique_ptr<TendLoop> loop;

	try {
		loop = std::make_unique<TendLoop>(*this);
	} catch (...) {
		logger(1, "Failed to create the tend loop: ",
		       std::current_exception());
		return;
	}

	{
		const std::scoped_lock lock{tend_loop_mutex};
		if (!IsTendValid())
			return;

		tend_loop = loop.get();
	}

	loop->Run();

	const std::scoped_lock lock{tend_loop_mutex};
	tend_loop = nullptr;
}

void
Cluster::InterruptTendSleep() noexcept
{
	const std::scoped_lock lock{tend_loop_mutex};
	if (tend_loop != nullptr)
		tend_loop->Wake();
}

void
Cluster::OnTendTimer() noexcept
{
	try {
		Tend();
	} catch (...) {
		logger(4, "Cluster tend failed: ", std::current_exception());
	}
}

void
Cluster::Tend()
{
	TendCycle(false);
}

void
Cluster::WaitTillStabilized()
{
	const unsigned cycles = std::max(config.stabilize_cycles, 1U);

	/* the node count of the previous cycle; the cluster is
	   stable when it does not change anymore */
	std::size_t count = SIZE_MAX;
	bool stable = false;

	for (unsigned i = 0; i < cycles; ++i) {
		TendCycle(config.fail_if_not_connected);

		const std::size_t n = GetSnapshot()->nodes.size();
		if (n == count || cycles == 1) {
			stable = true;
			break;
		}

		count = n;
	}

	const auto current = GetSnapshot();

	if (current->nodes.empty()) {
		if (config.fail_if_not_connected)
			throw ClusterError(ResultCode::SERVER_NOT_AVAILABLE,
					   "Cluster seed(s) failed");

		logger(4, "Cluster seed(s) failed");
	} else if (!stable) {
		if (config.fail_if_not_connected)
			throw ClusterError(ResultCode::CLIENT_ERROR,
					   "Cluster not stabilized after multiple tend attempts");

		logger(4, "Cluster not stabilized after multiple tend attempts");
	}

	/* remember all nodes as seeds in case the configured seeds
	   go away */
	std::vector<Host> hosts;
	hosts.reserve(current->nodes.size());
	for (const auto &node : current->nodes)
		hosts.push_back(node->GetHost());

	AddSeeds(hosts);
}

void
Cluster::SeedNode(const Host &seed,
		  std::map<std::string, std::shared_ptr<Node>, std::less<>> &nodes_to_add)
{
	NodeValidator nv(config, connector, logger);

	std::exception_ptr first_error;
	bool found = false;

	/* a host name may resolve to several nodes; add all of
	   them */
	for (const auto &address : nv.ResolveAliases(seed)) {
		try {
			nv.ValidateAddress(seed, address);
			found = true;

			if (nodes_to_add.find(nv.name) == nodes_to_add.end()) {
				auto saved_aliases = nv.aliases;
				auto node = CreateNode(std::move(nv));
				nodes_to_add.emplace(node->GetName(), std::move(node));
				nv.aliases = std::move(saved_aliases);
			} else
				nv.connection->Close();
		} catch (...) {
			logger.Fmt(6, "Address {} of seed {} failed: {}",
				   address, seed,
				   GetFullMessage(std::current_exception()));

			if (!first_error)
				first_error = std::current_exception();
		}
	}

	if (!found) {
		if (first_error)
			std::rethrow_exception(first_error);

		throw FmtClusterError(ResultCode::SERVER_NOT_AVAILABLE,
				      "Seed {} has no address", seed);
	}
}

void
Cluster::SeedNodes(bool fail_if_not_connected)
{
	const auto seed_list = GetSeeds();

	std::map<std::string, std::shared_ptr<Node>, std::less<>> nodes_to_add;
	std::vector<std::exception_ptr> errors(seed_list->size());

	for (std::size_t i = 0; i < seed_list->size(); ++i) {
		const auto &seed = (*seed_list)[i];

		try {
			SeedNode(seed, nodes_to_add);
		} catch (...) {
			errors[i] = std::current_exception();

			if (!fail_if_not_connected)
				logger.Fmt(4, "Seed {} failed: {}", seed,
					   GetFullMessage(errors[i]));
		}

		/* the first reachable seed is enough; its peers
		   lead to the other nodes */
		if (!nodes_to_add.empty())
			break;
	}

	if (!nodes_to_add.empty()) {
		Publish(GetSnapshot(), {}, nodes_to_add,
			GetSnapshot()->partition_map);
		return;
	}

	if (fail_if_not_connected) {
		std::string msg = "Failed to connect to host(s): ";

		for (std::size_t i = 0; i < seed_list->size(); ++i) {
			msg += fmt::format("\n{} {}", (*seed_list)[i],
					   errors[i] ? GetFullMessage(errors[i])
					   : std::string{"not tried"});
		}

		throw ConnectionError(msg);
	}
}

void
Cluster::TendCycle(bool fail_if_not_connected)
{
	const std::scoped_lock lock{tend_mutex};

	if (GetSnapshot()->nodes.empty())
		SeedNodes(fail_if_not_connected);

	const auto current = GetSnapshot();
	const auto &nodes = current->nodes;

	Peers peers(nodes.size() + 16);

	for (const auto &node : nodes) {
		node->reference_count = 0;
		node->partition_changed = false;
		node->rebalance_changed = false;

		if (!node->HasPeers())
			peers.use_peers = false;
	}

	for (const auto &node : nodes)
		node->Refresh(peers);

	if (peers.gen_changed) {
		/* refresh the peers of all nodes, even if only one
		   generation has changed */
		peers.refresh_count = 0;

		for (const auto &node : nodes)
			node->RefreshPeers(peers);
	}

	PartitionMapBuilder builder(current->partition_map);

	for (const auto &node : nodes)
		if (node->partition_changed)
			node->RefreshPartitions(peers, builder);

	for (const auto &node : nodes)
		if (node->rebalance_changed)
			node->RefreshRacks();

	std::vector<std::shared_ptr<Node>> to_remove;
	if (peers.gen_changed || !peers.use_peers)
		to_remove = FindNodesToRemove(*current, peers.refresh_count,
					      builder.Get());

	Publish(current, to_remove, peers.nodes, builder.Commit());

	const auto n = tend_count.fetch_add(1, std::memory_order_relaxed) + 1;

	const auto after = GetSnapshot();

	if (n % 30 == 0)
		for (const auto &node : after->nodes)
			node->BalanceConnections();

	if (config.max_error_rate > 0 &&
	    n % std::max(config.error_rate_window, 1U) == 0)
		for (const auto &node : after->nodes)
			node->ResetErrorCount();
}

std::vector<std::shared_ptr<Node>>
Cluster::FindNodesToRemove(const ClusterSnapshot &current,
			   unsigned refresh_count,
			   const PartitionMap &partition_map) const noexcept
{
	std::vector<std::shared_ptr<Node>> result;

	for (const auto &node : current.nodes) {
		if (!node->IsActive() || node->GetFailures() >= config.max_failures) {
			result.push_back(node);
			continue;
		}

		if (current.nodes.size() > 1 && refresh_count >= 1 &&
		    node->reference_count == 0) {
			/* no other node knows this one: remove it if it
			   is unreachable or owns no partition */
			if (node->GetFailures() > 0 ||
			    !PartitionMapContains(partition_map, *node))
				result.push_back(node);
		}
	}

	return result;
}

void
Cluster::Publish(const std::shared_ptr<const ClusterSnapshot> &current,
		 const std::vector<std::shared_ptr<Node>> &to_remove,
		 const std::map<std::string, std::shared_ptr<Node>, std::less<>> &to_add,
		 std::shared_ptr<const PartitionMap> partition_map) noexcept
{
	if (to_remove.empty() && to_add.empty() &&
	    partition_map == current->partition_map)
		return;

	auto next = std::make_shared<ClusterSnapshot>();
	next->nodes.reserve(current->nodes.size() + to_add.size());

	/* remove */

	for (const auto &node : current->nodes) {
		if (std::find(to_remove.begin(), to_remove.end(), node) == to_remove.end()) {
			next->nodes.push_back(node);
			continue;
		}

		if (IsTendValid())
			logger.Fmt(5, "Remove node {}", node->ToString());

		nodes_map.erase(node->GetName());

		for (const auto &alias : node->aliases) {
			auto i = aliases.find(alias);
			if (i != aliases.end() && i->second == node)
				aliases.erase(i);
		}

		node->Close();
	}

	/* add */

	for (const auto &[name, node] : to_add) {
		logger.Fmt(5, "Add node {}", node->ToString());

		next->nodes.push_back(node);
		nodes_map.insert_or_assign(name, node);

		for (const auto &alias : node->aliases)
			aliases.insert_or_assign(alias, node);
	}

	next->partition_map = std::move(partition_map);

	next->features = ALL_NODE_FEATURES;
	for (const auto &node : next->nodes)
		next->features &= node->GetFeatures();
	if (next->nodes.empty())
		next->features = 0;

	snapshot.store(std::move(next));
}
