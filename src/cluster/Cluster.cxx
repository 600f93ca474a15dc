// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Cluster.hxx"
#include "Node.hxx"
#include "NodeValidator.hxx"
#include "Connection.hxx"
#include "Error.hxx"
#include "Stats.hxx"

#include <algorithm>

/**
 * Copy the configured seeds.  With TLS, seeds without a TLS name
 * get the cluster name, or else their own host name.
 */
static std::shared_ptr<const std::vector<Host>>
MakeSeeds(const ClusterConfig &config)
{
	auto seeds = std::make_shared<std::vector<Host>>(config.seeds);

	if (config.tls)
		for (auto &i : *seeds)
			if (i.tls_name.empty())
				i.tls_name = config.name.empty()
					? i.name
					: config.name;

	return seeds;
}

Cluster::Cluster(const ClusterConfig &_config, Connector &_connector)
	:config(_config), connector(_connector),
	 logger(config.name.empty()
		? std::string{"cluster"}
		: "cluster " + config.name),
	 seeds(MakeSeeds(config)),
	 snapshot(std::make_shared<const ClusterSnapshot>()),
	 worker_pool(config.worker_threads)
{
	config.Check();
}

Cluster::~Cluster() noexcept
{
	Close();
}

void
Cluster::Start()
{
	WaitTillStabilized();
	StartTendThread();
}

void
Cluster::AddSeeds(const std::vector<Host> &hosts) noexcept
{
	auto old_seeds = seeds.load();

	while (true) {
		auto new_seeds = std::make_shared<std::vector<Host>>(*old_seeds);

		for (const auto &i : hosts)
			if (std::find(new_seeds->begin(), new_seeds->end(), i) == new_seeds->end())
				new_seeds->push_back(i);

		if (new_seeds->size() == old_seeds->size())
			return;

		std::shared_ptr<const std::vector<Host>> desired = std::move(new_seeds);
		if (seeds.compare_exchange_weak(old_seeds, desired))
			return;
	}
}

bool
Cluster::IsConnected() const noexcept
{
	const auto current = GetSnapshot();

	return std::any_of(current->nodes.begin(), current->nodes.end(),
			   [this](const auto &node){
				   return node->IsActive() &&
					   node->GetFailures() < config.max_failures;
			   });
}

std::vector<std::string>
Cluster::GetNodeNames() const noexcept
{
	const auto current = GetSnapshot();

	std::vector<std::string> names;
	names.reserve(current->nodes.size());
	for (const auto &node : current->nodes)
		names.push_back(node->GetName());
	return names;
}

std::shared_ptr<Node>
Cluster::GetNode(std::string_view name) const
{
	const auto current = GetSnapshot();

	for (const auto &node : current->nodes)
		if (node->GetName() == name && node->IsActive())
			return node;

	throw FmtClusterError(ResultCode::INVALID_NODE_ERROR,
			      "Invalid node name: {}", name);
}

ClusterStats
Cluster::GetStats() const noexcept
{
	const auto current = GetSnapshot();

	ClusterStats stats;
	stats.nodes.reserve(current->nodes.size());
	for (const auto &node : current->nodes)
		stats.nodes.emplace_back(node->GetStats());

	stats.invalid_node_count = invalid_node_count.load(std::memory_order_relaxed);
	stats.tend_count = GetTendCount();
	return stats;
}

std::shared_ptr<Node>
Cluster::CreateNode(NodeValidator &&nv)
{
	auto node = std::make_shared<Node>(*this, std::move(nv));
	node->CreateMinConnections();
	return node;
}

Node *
Cluster::FindNodeByName(std::string_view name) const noexcept
{
	auto i = nodes_map.find(name);
	return i != nodes_map.end() ? i->second.get() : nullptr;
}

Node *
Cluster::FindAlias(const Host &host) const noexcept
{
	auto i = aliases.find(host);
	return i != aliases.end() ? i->second.get() : nullptr;
}

void
Cluster::AddAlias(const Host &host, Node &node) noexcept
{
	aliases.insert_or_assign(host, node.shared_from_this());
}

void
Cluster::Close() noexcept
{
	if (closed.exchange(true))
		return;

	tend_valid = false;
	InterruptTendSleep();

	if (tend_thread.joinable())
		tend_thread.join();

	close_token.Cancel();
	worker_pool.Stop();

	/* wait for a Tend() call in another thread to finish */
	const std::scoped_lock lock{tend_mutex};

	for (const auto &node : GetSnapshot()->nodes)
		node->Close();
}
