// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "FakeNetwork.hxx"
#include "cluster/Cluster.hxx"
#include "cluster/Node.hxx"
#include "cluster/Error.hxx"
#include "scan/PartitionTracker.hxx"
#include "scan/PartitionFilter.hxx"

#include <kvcluster/Protocol.hxx>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <thread>

using KvCluster::PARTITIONS;

namespace {

/**
 * "A" is the master of the lower half, "B" of the upper half.
 */
struct HalfAndHalf {
	FakeNetwork network;
	std::unique_ptr<Cluster> cluster;

	explicit HalfAndHalf(const char *features="peers;replicas;pquery") {
		auto &a = network.AddServer("10.0.0.1", "A");
		a.features = features;
		a.peers = MakePeers(1, {{"B", "10.0.0.2"}});
		a.replicas = fmt::format("test:0,1,{}",
					 MakeBitmapRange(0, PARTITIONS / 2));

		auto &b = network.AddServer("10.0.0.2", "B");
		b.features = features;
		b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
		b.replicas = fmt::format("test:0,1,{}",
					 MakeBitmapRange(PARTITIONS / 2, PARTITIONS));

		ClusterConfig config;
		config.seeds.emplace_back("10.0.0.1", DEFAULT_NODE_PORT);
		config.worker_threads = 2;

		cluster = std::make_unique<Cluster>(config, network);
		cluster->WaitTillStabilized();
	}
};

} // anonymous namespace

static ResultCode
CatchCode(auto &&f)
{
	try {
		f();
	} catch (const ClusterError &e) {
		return e.GetCode();
	}

	return ResultCode::OK;
}

static NodePartitions &
FindUnit(std::vector<NodePartitions> &units, std::string_view name)
{
	for (auto &i : units)
		if (i.node->GetName() == name)
			return i;

	throw std::runtime_error("No such unit");
}

TEST(TestPartitionTracker, InvalidParameters)
{
	ScanPolicy policy;

	auto filter = PartitionFilter::Range(PARTITIONS, 1);
	EXPECT_EQ(CatchCode([&]{ PartitionTracker t(policy, 2, filter); }),
		  ResultCode::PARAMETER_ERROR);

	filter = PartitionFilter::Range(0, 0);
	EXPECT_EQ(CatchCode([&]{ PartitionTracker t(policy, 2, filter); }),
		  ResultCode::PARAMETER_ERROR);

	filter = PartitionFilter::Range(4000, 100);
	EXPECT_EQ(CatchCode([&]{ PartitionTracker t(policy, 2, filter); }),
		  ResultCode::PARAMETER_ERROR);

	/* begin+count must not wrap around */
	filter = PartitionFilter::Range(1, 0xffffffffu);
	EXPECT_EQ(CatchCode([&]{ PartitionTracker t(policy, 2, filter); }),
		  ResultCode::PARAMETER_ERROR);

	policy.max_records = -1;
	EXPECT_EQ(CatchCode([&]{ PartitionTracker t(policy, 2); }),
		  ResultCode::PARAMETER_ERROR);
}

TEST(TestPartitionTracker, AssignAll)
{
	HalfAndHalf h;

	PartitionTracker tracker(ScanPolicy{}, 2);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units.size(), 2u);

	EXPECT_EQ(FindUnit(units, "A").parts_full.size(), PARTITIONS / 2);
	EXPECT_EQ(FindUnit(units, "B").parts_full.size(), PARTITIONS / 2);
	EXPECT_EQ(FindUnit(units, "A").record_max, 0u);

	EXPECT_EQ(CatchCode([&]{ tracker.AssignPartitionsToNodes(*h.cluster, "nope"); }),
		  ResultCode::INVALID_NAMESPACE);
}

TEST(TestPartitionTracker, NodeFilter)
{
	HalfAndHalf h;

	PartitionTracker tracker(ScanPolicy{}, "B");
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units.size(), 1u);
	EXPECT_EQ(units.front().node->GetName(), "B");
	EXPECT_EQ(units.front().GetPartitionCount(), PARTITIONS / 2);
}

TEST(TestPartitionTracker, UnknownNodeFilter)
{
	HalfAndHalf h;

	PartitionTracker tracker(ScanPolicy{}, "Z");
	EXPECT_EQ(CatchCode([&]{ tracker.AssignPartitionsToNodes(*h.cluster, "test"); }),
		  ResultCode::INVALID_NODE_ERROR);
}

TEST(TestPartitionTracker, MaxRecordsDistribution)
{
	HalfAndHalf h;

	ScanPolicy policy;
	policy.max_records = 5;

	PartitionTracker tracker(policy, 2);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units.size(), 2u);
	EXPECT_EQ(units[0].record_max, 3u);
	EXPECT_EQ(units[1].record_max, 2u);

	/* fewer records than nodes: only one unit */
	policy.max_records = 1;
	PartitionTracker tracker2(policy, 2);
	auto &units2 = tracker2.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units2.size(), 1u);
	EXPECT_EQ(units2[0].record_max, 1u);
}

TEST(TestPartitionTracker, AllowRecord)
{
	HalfAndHalf h;

	ScanPolicy policy;
	policy.max_records = 2;

	PartitionTracker tracker(policy, 2);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units.size(), 2u);

	auto &unit = units.front();
	EXPECT_TRUE(tracker.AllowRecord(unit));
	EXPECT_FALSE(tracker.AllowRecord(unit));
	EXPECT_EQ(unit.record_count, 1u);
}

TEST(TestPartitionTracker, CompleteWithoutErrors)
{
	HalfAndHalf h;

	auto filter = PartitionFilter::All();
	PartitionTracker tracker(ScanPolicy{}, 2, filter);
	tracker.AssignPartitionsToNodes(*h.cluster, "test");

	EXPECT_TRUE(tracker.IsComplete(*h.cluster));
	EXPECT_TRUE(filter.IsDone());
}

TEST(TestPartitionTracker, RetryOneNode)
{
	HalfAndHalf h;

	PartitionTracker tracker(ScanPolicy{}, 2);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");

	const ClusterError timeout(ResultCode::TIMEOUT, "timeout");
	EXPECT_TRUE(tracker.ShouldRetry(FindUnit(units, "B"), timeout));

	const ClusterError fatal(ResultCode::PARAMETER_ERROR, "bad");
	EXPECT_FALSE(tracker.ShouldRetry(FindUnit(units, "A"), fatal));

	EXPECT_FALSE(tracker.IsComplete(*h.cluster));
	EXPECT_EQ(tracker.GetIteration(), 2u);

	/* only the failed node's partitions are assigned again */
	auto &units2 = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units2.size(), 1u);
	EXPECT_EQ(units2.front().node->GetName(), "B");
	EXPECT_EQ(units2.front().GetPartitionCount(), PARTITIONS / 2);

	EXPECT_TRUE(tracker.IsComplete(*h.cluster));
}

TEST(TestPartitionTracker, ReassignAfterRebalance)
{
	/* "A" owns the lower half, "C" the upper half, "B" nothing */
	FakeNetwork network;

	auto &a = network.AddServer("10.0.0.1", "A");
	a.peers = MakePeers(1, {{"B", "10.0.0.2"}, {"C", "10.0.0.3"}});
	a.replicas = fmt::format("test:0,1,{}",
				 MakeBitmapRange(0, PARTITIONS / 2));

	auto &b = network.AddServer("10.0.0.2", "B");
	b.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	b.replicas = fmt::format("test:0,1,{}", MakeBitmap({}));

	auto &c = network.AddServer("10.0.0.3", "C");
	c.peers = MakePeers(1, {{"A", "10.0.0.1"}});
	c.replicas = fmt::format("test:0,1,{}",
				 MakeBitmapRange(PARTITIONS / 2, PARTITIONS));

	ClusterConfig config;
	config.seeds.emplace_back("10.0.0.1", DEFAULT_NODE_PORT);
	config.worker_threads = 2;

	Cluster cluster(config, network);
	cluster.WaitTillStabilized();
	ASSERT_EQ(cluster.GetNodes().size(), 3u);

	PartitionTracker tracker(ScanPolicy{}, 3);
	auto &units = tracker.AssignPartitionsToNodes(cluster, "test");
	ASSERT_EQ(units.size(), 2u);

	/* "C" has delivered part of partition 3000 and then timed
	   out; "A" has finished */
	auto &c_unit = FindUnit(units, "C");
	const auto digest = MakeDigest(3000, 7);
	tracker.SetLast(c_unit, digest, 0);
	EXPECT_TRUE(tracker.ShouldRetry(c_unit,
					ClusterError(ResultCode::TIMEOUT, "timeout")));
	EXPECT_FALSE(tracker.IsComplete(cluster));

	/* the upper half moves from "C" to "B" */
	network.Edit("10.0.0.3", [](FakeServer &s){
		s.replicas = fmt::format("test:0,1,{}", MakeBitmap({}));
		++s.partition_generation;
	});
	network.Edit("10.0.0.2", [](FakeServer &s){
		s.replicas = fmt::format("test:0,1,{}",
					 MakeBitmapRange(PARTITIONS / 2, PARTITIONS));
		++s.partition_generation;
	});

	cluster.Tend();
	ASSERT_EQ(cluster.GetMasterNode({"test", 3000})->GetName(), "B");

	auto &units2 = tracker.AssignPartitionsToNodes(cluster, "test");
	ASSERT_EQ(units2.size(), 1u);
	EXPECT_EQ(units2.front().node->GetName(), "B");
	EXPECT_EQ(units2.front().GetPartitionCount(), PARTITIONS / 2);

	/* the interrupted partition resumes after the last digest */
	ASSERT_EQ(units2.front().parts_partial.size(), 1u);
	EXPECT_EQ(units2.front().parts_partial.front()->id, 3000u);
	EXPECT_EQ(units2.front().parts_partial.front()->digest, digest);

	EXPECT_TRUE(tracker.IsComplete(cluster));
}

TEST(TestPartitionTracker, PartitionUnavailable)
{
	HalfAndHalf h;

	PartitionTracker tracker(ScanPolicy{}, 2);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");

	auto &a = FindUnit(units, "A");
	tracker.PartitionUnavailable(a, 7);
	EXPECT_EQ(a.parts_unavailable, 1u);

	/* a partition which is not part of this scan */
	auto filter = PartitionFilter::Range(0, 10);
	PartitionTracker tracker2(ScanPolicy{}, 2, filter);
	auto &units2 = tracker2.AssignPartitionsToNodes(*h.cluster, "test");
	EXPECT_EQ(CatchCode([&]{ tracker2.PartitionUnavailable(units2.front(), 100); }),
		  ResultCode::PARSE_ERROR);

	EXPECT_FALSE(tracker.IsComplete(*h.cluster));

	auto &units3 = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units3.size(), 1u);
	ASSERT_EQ(units3.front().parts_full.size(), 1u);
	EXPECT_EQ(units3.front().parts_full.front()->id, 7u);
}

TEST(TestPartitionTracker, MaxRetriesExceeded)
{
	HalfAndHalf h;

	ScanPolicy policy;
	policy.max_retries = 1;

	PartitionTracker tracker(policy, 2);
	const ClusterError timeout(ResultCode::TIMEOUT, "node timeout");

	for (unsigned i = 0; i < 2; ++i) {
		auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
		tracker.ShouldRetry(units.front(), timeout);

		if (i == 0) {
			EXPECT_FALSE(tracker.IsComplete(*h.cluster));
			continue;
		}

		try {
			tracker.IsComplete(*h.cluster);
			FAIL();
		} catch (const ClusterError &e) {
			EXPECT_EQ(e.GetCode(), ResultCode::MAX_RETRIES_EXCEEDED);

			const std::string_view msg = e.what();
			EXPECT_TRUE(msg.starts_with("Max retries exceeded: 1"));
			EXPECT_NE(msg.find("sub-exceptions:"), msg.npos);
			EXPECT_NE(msg.find("node timeout"), msg.npos);
		}
	}
}

TEST(TestPartitionTracker, TotalTimeout)
{
	HalfAndHalf h;

	ScanPolicy policy;
	policy.total_timeout = std::chrono::milliseconds(1);
	policy.socket_timeout = std::chrono::milliseconds(5000);

	PartitionTracker tracker(policy, 2);

	/* the socket timeout is clamped to the total timeout */
	EXPECT_EQ(tracker.GetSocketTimeout(), std::chrono::milliseconds(1));

	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	tracker.ShouldRetry(units.front(),
			    ClusterError(ResultCode::SERVER_NOT_AVAILABLE, "down"));

	std::this_thread::sleep_for(std::chrono::milliseconds(5));

	EXPECT_EQ(CatchCode([&]{ tracker.IsComplete(*h.cluster); }),
		  ResultCode::TIMEOUT);
}

TEST(TestPartitionTracker, ResumeAfterDigest)
{
	HalfAndHalf h;

	const auto digest = MakeDigest(3000, 42);
	auto filter = PartitionFilter::After(digest);
	EXPECT_EQ(filter.begin, 3000u);
	EXPECT_EQ(filter.count, 1u);

	PartitionTracker tracker(ScanPolicy{}, 2, filter);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units.size(), 1u);
	EXPECT_EQ(units.front().node->GetName(), "B");
	EXPECT_TRUE(units.front().parts_full.empty());
	ASSERT_EQ(units.front().parts_partial.size(), 1u);
	EXPECT_EQ(units.front().parts_partial.front()->digest, digest);
}

TEST(TestPartitionTracker, ReuseFilterWithLimit)
{
	HalfAndHalf h;

	ScanPolicy policy;
	policy.max_records = 2;

	auto filter = PartitionFilter::All();

	{
		PartitionTracker tracker(policy, 2, filter);
		auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
		ASSERT_EQ(units.size(), 2u);

		/* "A" delivers its single record, "B" delivers
		   nothing */
		auto &a = FindUnit(units, "A");
		ASSERT_TRUE(tracker.AllowRecord(a));
		tracker.SetLast(a, MakeDigest(5), 0);

		EXPECT_TRUE(tracker.IsComplete(*h.cluster));
		EXPECT_FALSE(filter.IsDone());
		EXPECT_FALSE(filter.retry);
		EXPECT_EQ(filter.partitions[5].digest, MakeDigest(5));
	}

	/* the next page only queries "A" which has reached its
	   limit */
	PartitionTracker tracker(policy, 2, filter);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");
	ASSERT_EQ(units.size(), 1u);
	EXPECT_EQ(units.front().node->GetName(), "A");
	EXPECT_EQ(units.front().parts_partial.size(), 1u);
	EXPECT_EQ(units.front().parts_full.size(), PARTITIONS / 2 - 1);
}

TEST(TestPartitionTracker, ReuseFilterOldServers)
{
	/* without "pquery", a node is only done when it has delivered
	   nothing */
	HalfAndHalf h("peers;replicas");
	ASSERT_FALSE(h.cluster->HasPartitionQuery());

	ScanPolicy policy;
	policy.max_records = 10;

	auto filter = PartitionFilter::All();
	PartitionTracker tracker(policy, 2, filter);
	auto &units = tracker.AssignPartitionsToNodes(*h.cluster, "test");

	auto &b = FindUnit(units, "B");
	ASSERT_TRUE(tracker.AllowRecord(b));
	tracker.SetLast(b, MakeDigest(PARTITIONS - 1), 0);

	EXPECT_TRUE(tracker.IsComplete(*h.cluster));
	EXPECT_FALSE(filter.IsDone());
	EXPECT_TRUE(filter.partitions[PARTITIONS - 1].retry);
	EXPECT_FALSE(filter.partitions[0].retry);
}

TEST(TestPartitionTracker, PartitionError)
{
	HalfAndHalf h;

	ScanPolicy policy;
	policy.max_records = 10;

	auto filter = PartitionFilter::All();
	PartitionTracker tracker(policy, 2, filter);
	tracker.AssignPartitionsToNodes(*h.cluster, "test");
	EXPECT_TRUE(filter.retry);

	filter.retry = false;
	tracker.PartitionError();
	EXPECT_TRUE(filter.retry);
}
