// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "FakeNetwork.hxx"
#include "cluster/Cluster.hxx"
#include "cluster/Node.hxx"
#include "cluster/Error.hxx"
#include "cluster/Stats.hxx"

#include <gtest/gtest.h>

#include <kvcluster/Protocol.hxx>

#include <fmt/format.h>

#include <algorithm>
#include <thread>

using KvCluster::PARTITIONS;

static ClusterConfig
MakeConfig(std::initializer_list<std::string_view> seeds)
{
	ClusterConfig config;
	for (const auto i : seeds)
		config.seeds.emplace_back(i, DEFAULT_NODE_PORT);
	config.worker_threads = 2;
	return config;
}

static std::string
MakeReplicas(std::string_view ns, std::string_view bitmap)
{
	return fmt::format("{}:0,1,{}", ns, bitmap);
}

static const Node *
GetMaster(const Cluster &cluster, unsigned id)
{
	return cluster.GetMasterNode({"test", id}).get();
}

TEST(TestCluster, SingleSeed)
{
	FakeNetwork network;
	auto &a = network.AddServer("10.0.0.1", "A");
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();

	ASSERT_EQ(cluster.GetNodeNames(), std::vector<std::string>{"A"});
	EXPECT_TRUE(cluster.IsConnected());
	EXPECT_EQ(cluster.GetMasterNode({"test", 0})->GetName(), "A");
	EXPECT_EQ(cluster.GetMasterNode({"test", PARTITIONS - 1})->GetName(), "A");
	EXPECT_TRUE(cluster.HasPartitionQuery());
	EXPECT_FALSE(cluster.SupportsDouble());
}

TEST(TestCluster, PeerDiscovery)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS / 2));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = MakeReplicas("test", MakeBitmapRange(PARTITIONS / 2, PARTITIONS));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();

	auto names = cluster.GetNodeNames();
	std::sort(names.begin(), names.end());
	ASSERT_EQ(names, (std::vector<std::string>{"A", "B"}));

	EXPECT_EQ(GetMaster(cluster, 0)->GetName(), "A");
	EXPECT_EQ(GetMaster(cluster, PARTITIONS - 1)->GetName(), "B");

	/* the discovered node has become a seed */
	const auto seeds = cluster.GetSeeds();
	EXPECT_EQ(seeds->size(), 2u);
}

TEST(TestCluster, FirstReachableSeedWins)
{
	FakeNetwork network;
	auto &b = network.AddServer("10.0.0.2", "B");
	b.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	Cluster cluster(MakeConfig({"10.0.0.1", "10.0.0.2"}), network);
	cluster.WaitTillStabilized();

	EXPECT_EQ(cluster.GetNodeNames(), std::vector<std::string>{"B"});
}

TEST(TestCluster, SeedsFailFast)
{
	FakeNetwork network;

	Cluster cluster(MakeConfig({"10.0.0.1", "10.0.0.2"}), network);

	try {
		cluster.WaitTillStabilized();
		FAIL();
	} catch (const ClusterError &e) {
		EXPECT_EQ(e.GetCode(), ResultCode::SERVER_NOT_AVAILABLE);

		const std::string_view msg = e.what();
		EXPECT_TRUE(msg.starts_with("Failed to connect to host(s): "));
		EXPECT_NE(msg.find("10.0.0.1"), msg.npos);
		EXPECT_NE(msg.find("10.0.0.2"), msg.npos);
	}
}

TEST(TestCluster, SeedsFailQuietly)
{
	FakeNetwork network;

	auto config = MakeConfig({"10.0.0.1"});
	config.fail_if_not_connected = false;

	Cluster cluster(config, network);
	cluster.WaitTillStabilized();

	EXPECT_TRUE(cluster.GetNodes().empty());
	EXPECT_FALSE(cluster.IsConnected());

	EXPECT_THROW(cluster.GetRandomNode(), ClusterError);
	EXPECT_EQ(cluster.GetStats().invalid_node_count, 1u);
}

TEST(TestCluster, ClusterNameMismatch)
{
	FakeNetwork network;
	auto &a = network.AddServer("10.0.0.1", "A");
	a.cluster_name = "other";

	auto config = MakeConfig({"10.0.0.1"});
	config.name = "main";

	Cluster cluster(config, network);
	EXPECT_THROW(cluster.WaitTillStabilized(), ClusterError);
	EXPECT_TRUE(cluster.GetNodes().empty());
}

TEST(TestCluster, NotInitialized)
{
	FakeNetwork network;
	auto &a = network.AddServer("10.0.0.1", "A");
	a.partition_generation = -1;

	auto config = MakeConfig({"10.0.0.1"});
	config.fail_if_not_connected = false;

	Cluster cluster(config, network);
	cluster.WaitTillStabilized();
	EXPECT_TRUE(cluster.GetNodes().empty());
}

TEST(TestCluster, SeedResolvesToSeveralNodes)
{
	FakeNetwork network;
	network.AddDns("db.example.com", {"10.0.0.1", "10.0.0.2"});

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS / 2));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = MakeReplicas("test", MakeBitmapRange(PARTITIONS / 2, PARTITIONS));

	Cluster cluster(MakeConfig({"db.example.com"}), network);
	cluster.Tend();

	/* both addresses were validated while seeding */
	EXPECT_EQ(cluster.GetNodes().size(), 2u);
}

TEST(TestCluster, RemoveAfterFailures)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS / 2));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = MakeReplicas("test", MakeBitmapRange(PARTITIONS / 2, PARTITIONS));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();
	ASSERT_EQ(cluster.GetNodes().size(), 2u);

	network.Edit("10.0.0.2", [](FakeServer &s){ s.down = true; });

	/* A still lists B as a peer; B survives until it has failed
	   five times */
	for (unsigned i = 1; i < 5; ++i) {
		cluster.Tend();
		ASSERT_EQ(cluster.GetNodes().size(), 2u) << "cycle " << i;
	}

	cluster.Tend();
	EXPECT_EQ(cluster.GetNodeNames(), std::vector<std::string>{"A"});
}

TEST(TestCluster, ConfigurableFailureThreshold)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = MakeReplicas("test", MakeBitmap({}));

	auto config = MakeConfig({"10.0.0.1"});
	config.max_failures = 2;

	Cluster cluster(config, network);
	cluster.WaitTillStabilized();
	ASSERT_EQ(cluster.GetNodes().size(), 2u);

	network.Edit("10.0.0.2", [](FakeServer &s){ s.down = true; });

	cluster.Tend();
	EXPECT_EQ(cluster.GetNodes().size(), 2u);

	cluster.Tend();
	EXPECT_EQ(cluster.GetNodes().size(), 1u);
}

TEST(TestCluster, Rebalance)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = MakeReplicas("test", MakeBitmap({}));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();

	EXPECT_EQ(GetMaster(cluster, 0)->GetName(), "A");
	EXPECT_EQ(GetMaster(cluster, PARTITIONS - 1)->GetName(), "A");

	const auto old_map = cluster.GetSnapshot()->partition_map;

	/* B takes over the upper half */
	network.Edit("10.0.0.1", [](FakeServer &s){
		s.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS / 2));
		++s.partition_generation;
	});
	network.Edit("10.0.0.2", [](FakeServer &s){
		s.replicas = MakeReplicas("test", MakeBitmapRange(PARTITIONS / 2, PARTITIONS));
		++s.partition_generation;
	});

	cluster.Tend();

	EXPECT_EQ(GetMaster(cluster, 0)->GetName(), "A");
	EXPECT_EQ(GetMaster(cluster, PARTITIONS / 2 - 1)->GetName(), "A");
	EXPECT_EQ(GetMaster(cluster, PARTITIONS / 2)->GetName(), "B");
	EXPECT_EQ(GetMaster(cluster, PARTITIONS - 1)->GetName(), "B");

	/* the published map was never modified */
	EXPECT_EQ(old_map->at("test")->replicas.front()[PARTITIONS - 1]->GetName(),
		  "A");
}

TEST(TestCluster, TendIsIdempotent)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS / 2));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = MakeReplicas("test", MakeBitmapRange(PARTITIONS / 2, PARTITIONS));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();

	const auto before = cluster.GetSnapshot();
	const auto n_connects = network.GetConnectCount();

	cluster.Tend();
	cluster.Tend();

	EXPECT_EQ(cluster.GetSnapshot(), before);
	EXPECT_EQ(network.GetConnectCount(), n_connects);
}

TEST(TestCluster, NotStabilized)
{
	FakeNetwork network;

	/* a chain: each node only knows the next one, so every cycle
	   discovers one more node */
	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"C", "10.0.0.3"}});
	b.replicas = MakeReplicas("test", MakeBitmap({}));

	auto &c = network.AddServer("10.0.0.3", "C");
	c.peers = MakePeers(1, {{"D", "10.0.0.4"}});
	c.replicas = MakeReplicas("test", MakeBitmap({}));

	auto &d = network.AddServer("10.0.0.4", "D");
	d.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	d.replicas = MakeReplicas("test", MakeBitmap({}));

	auto config = MakeConfig({"10.0.0.1"});
	config.stabilize_cycles = 2;

	Cluster cluster(config, network);

	try {
		cluster.WaitTillStabilized();
		FAIL();
	} catch (const ClusterError &e) {
		EXPECT_EQ(e.GetCode(), ResultCode::CLIENT_ERROR);
	}

	/* the tend thread would pick up the rest */
	cluster.Tend();
	cluster.Tend();
	EXPECT_EQ(cluster.GetNodes().size(), 4u);
}

TEST(TestCluster, ServicesMode)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.features = "replicas";
	a.services = "10.0.0.2:3000";
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS / 2));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.features = "replicas";
	b.services = "10.0.0.1:3000";
	b.replicas = MakeReplicas("test", MakeBitmapRange(PARTITIONS / 2, PARTITIONS));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();

	auto names = cluster.GetNodeNames();
	std::sort(names.begin(), names.end());
	ASSERT_EQ(names, (std::vector<std::string>{"A", "B"}));
	EXPECT_EQ(GetMaster(cluster, PARTITIONS - 1)->GetName(), "B");
}

TEST(TestCluster, NodeNameChanged)
{
	FakeNetwork network;
	auto &a = network.AddServer("10.0.0.1", "A");
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	auto config = MakeConfig({"10.0.0.1"});
	config.fail_if_not_connected = false;

	Cluster cluster(config, network);
	cluster.WaitTillStabilized();
	ASSERT_EQ(cluster.GetNodeNames(), std::vector<std::string>{"A"});

	network.Edit("10.0.0.1", [](FakeServer &s){ s.name = "X"; });

	/* "A" is deactivated and removed; the next cycle seeds "X" */
	cluster.Tend();
	EXPECT_TRUE(cluster.GetNodes().empty());

	cluster.Tend();
	EXPECT_EQ(cluster.GetNodeNames(), std::vector<std::string>{"X"});
}

TEST(TestCluster, TendThread)
{
	FakeNetwork network;
	auto &a = network.AddServer("10.0.0.1", "A");
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	auto config = MakeConfig({"10.0.0.1"});
	config.tend_interval = std::chrono::milliseconds(10);

	Cluster cluster(config, network);
	cluster.Start();

	/* IsConnected() reads the failure counters while the tend
	   thread updates them */
	const auto start = cluster.GetTendCount();
	for (unsigned i = 0; i < 500 && cluster.GetTendCount() < start + 3; ++i) {
		EXPECT_TRUE(cluster.IsConnected());
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}

	EXPECT_GE(cluster.GetTendCount(), start + 3);

	cluster.Close();
	EXPECT_FALSE(cluster.IsTendValid());
	EXPECT_TRUE(cluster.GetCloseToken().IsCancelled());

	/* Close() is idempotent */
	cluster.Close();
}

TEST(TestCluster, InvalidConfig)
{
	FakeNetwork network;

	ClusterConfig config;
	EXPECT_THROW((Cluster{config, network}), std::runtime_error);

	config = MakeConfig({"10.0.0.1"});
	config.min_connections = 10;
	config.max_connections = 5;
	EXPECT_THROW((Cluster{config, network}), std::runtime_error);
}

TEST(TestCluster, FailedPartitionRefreshKeepsMap)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = MakeReplicas("test", MakeBitmap({}));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();

	const auto old_map = cluster.GetSnapshot()->partition_map;

	/* the first namespace is valid, the second one has a broken
	   bitmap */
	network.Edit("10.0.0.2", [](FakeServer &s){
		s.replicas = MakeReplicas("test", MakeBitmapRange(PARTITIONS / 2, PARTITIONS)) +
			";zzz:0,1,@@@@";
		++s.partition_generation;
	});

	cluster.Tend();

	const auto nodes = cluster.GetNodes();
	const auto b_node = std::find_if(nodes.begin(), nodes.end(),
					 [](const auto &n){ return n->GetName() == "B"; });
	ASSERT_NE(b_node, nodes.end());
	EXPECT_EQ((*b_node)->GetFailures(), 1u);

	/* nothing of the rejected response was applied */
	EXPECT_EQ(GetMaster(cluster, PARTITIONS - 1)->GetName(), "A");
	EXPECT_EQ(cluster.GetSnapshot()->partition_map, old_map);
	EXPECT_EQ(cluster.GetSnapshot()->partition_map->count("zzz"), 0u);
}

TEST(TestCluster, RemoveUnreferencedNode)
{
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}, {"C", "10.0.0.3"}});
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}, {"C", "10.0.0.3"}});
	b.replicas = MakeReplicas("test", MakeBitmap({}));

	auto &c = network.AddServer("10.0.0.3", "C");
	c.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	c.replicas = MakeReplicas("test", MakeBitmap({}));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();
	ASSERT_EQ(cluster.GetNodes().size(), 3u);

	/* C is still reachable, but nobody lists it anymore and it
	   owns no partition */
	network.Edit("10.0.0.1", [](FakeServer &s){
		s.peers = MakePeers(2, {{"B", "10.0.0.2"}});
		s.peers_generation = 2;
	});
	network.Edit("10.0.0.2", [](FakeServer &s){
		s.peers = MakePeers(2, {{"A", "10.0.0.1"}});
		s.peers_generation = 2;
	});

	cluster.Tend();

	auto names = cluster.GetNodeNames();
	std::sort(names.begin(), names.end());
	EXPECT_EQ(names, (std::vector<std::string>{"A", "B"}));

	cluster.Tend();
	EXPECT_EQ(cluster.GetNodes().size(), 2u);
}

TEST(TestCluster, DefaultTlsName)
{
	FakeNetwork network;
	auto &a = network.AddServer("10.0.0.1", "A");
	a.cluster_name = "prod";
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	/* the cluster name is the default */
	auto config = MakeConfig({"10.0.0.1"});
	config.name = "prod";
	config.tls = true;

	{
		Cluster cluster(config, network);
		EXPECT_EQ(cluster.GetSeeds()->front().tls_name, "prod");

		cluster.WaitTillStabilized();
		EXPECT_EQ(cluster.GetNodeNames(), std::vector<std::string>{"A"});
		EXPECT_EQ(network.GetLastTlsName(), "prod");
	}

	/* without a cluster name, the host name */
	config.name.clear();
	EXPECT_EQ(Cluster(config, network).GetSeeds()->front().tls_name,
		  "10.0.0.1");

	/* an explicit TLS name is kept */
	config.seeds.front().tls_name = "node-a";
	EXPECT_EQ(Cluster(config, network).GetSeeds()->front().tls_name,
		  "node-a");

	/* no TLS, no TLS name */
	config.seeds.front().tls_name.clear();
	config.tls = false;
	EXPECT_TRUE(Cluster(config, network).GetSeeds()->front().tls_name.empty());
}

TEST(TestCluster, ConnectionLease)
{
	FakeNetwork network;
	auto &a = network.AddServer("10.0.0.1", "A");
	a.replicas = MakeReplicas("test", MakeBitmapRange(0, PARTITIONS));

	Cluster cluster(MakeConfig({"10.0.0.1"}), network);
	cluster.WaitTillStabilized();

	const auto node = cluster.GetNode("A");

	{
		auto lease = node->GetConnection();
		EXPECT_EQ(&lease.GetNode(), node.get());
		EXPECT_EQ(node->GetStats().in_use, 1u);
		lease.Release(PutAction::REUSE);
	}

	EXPECT_EQ(node->GetStats().in_use, 0u);
	EXPECT_EQ(node->GetStats().in_pool, 1u);

	const auto closed = node->GetStats().closed;

	{
		/* destroyed without Release(): the connection is
		   closed */
		auto lease = node->GetConnection();
		EXPECT_EQ(node->GetStats().in_pool, 0u);
	}

	const auto stats = node->GetStats();
	EXPECT_EQ(stats.in_use, 0u);
	EXPECT_EQ(stats.in_pool, 0u);
	EXPECT_EQ(stats.closed, closed + 1);
}
