// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "cluster/Info.hxx"
#include "cluster/Features.hxx"
#include "cluster/Partition.hxx"
#include "cluster/Error.hxx"

#include <gtest/gtest.h>

#include <cstring>

using namespace KvCluster;

TEST(TestInfo, Request)
{
	EXPECT_EQ(MakeInfoRequest({"node", "features"}), "node\nfeatures\n");
	EXPECT_EQ(MakeInfoRequest({}), "");
}

TEST(TestInfo, Header)
{
	const auto message = EncodeInfoMessage("node\n");
	ASSERT_EQ(message.size(), sizeof(InfoHeader) + 5);
	EXPECT_EQ(message.substr(sizeof(InfoHeader)), "node\n");

	InfoHeader header;
	memcpy(&header, message.data(), sizeof(header));
	EXPECT_EQ(header.version, INFO_PROTOCOL_VERSION);
	EXPECT_EQ(header.type, INFO_MESSAGE_TYPE);
	EXPECT_EQ(header.length[5], 5);
	EXPECT_EQ(DecodeInfoHeader(header), 5u);

	header.length[3] = 1;
	EXPECT_EQ(DecodeInfoHeader(header), 0x10005u);

	/* too large */
	header.length[0] = 1;
	EXPECT_THROW(DecodeInfoHeader(header), ClusterError);

	header = {};
	header.version = 1;
	header.type = INFO_MESSAGE_TYPE;
	EXPECT_THROW(DecodeInfoHeader(header), ClusterError);

	header.version = INFO_PROTOCOL_VERSION;
	header.type = 3;
	EXPECT_THROW(DecodeInfoHeader(header), ClusterError);
}

TEST(TestInfo, ParseResponse)
{
	const auto map = ParseInfoResponse("node\tBB9\nfeatures\tpeers;replicas\nempty\n\npartition-generation\t7\n");
	ASSERT_EQ(map.size(), 4u);
	EXPECT_EQ(map.at("node"), "BB9");
	EXPECT_EQ(map.at("features"), "peers;replicas");
	EXPECT_EQ(map.at("empty"), "");
	EXPECT_EQ(map.at("partition-generation"), "7");

	EXPECT_EQ(GetInfoValue(map, "node"), "BB9");

	try {
		GetInfoValue(map, "empty");
		FAIL();
	} catch (const ClusterError &e) {
		EXPECT_EQ(e.GetCode(), ResultCode::PARSE_ERROR);
	}

	EXPECT_THROW(GetInfoValue(map, "cluster-name"), ClusterError);
}

TEST(TestInfo, ParseInteger)
{
	EXPECT_EQ(ParseInfoInteger("gen", "42"), 42);
	EXPECT_EQ(ParseInfoInteger("gen", " -1 "), -1);
	EXPECT_THROW(ParseInfoInteger("gen", ""), ClusterError);
	EXPECT_THROW(ParseInfoInteger("gen", "4x"), ClusterError);
}

TEST(TestInfo, Features)
{
	const unsigned features = ParseFeatures("peers; replicas;pquery;float;unknown-feature;");
	EXPECT_TRUE(HasFeature(features, NodeFeature::PEERS));
	EXPECT_TRUE(HasFeature(features, NodeFeature::REPLICAS));
	EXPECT_TRUE(HasFeature(features, NodeFeature::PARTITION_QUERY));
	EXPECT_TRUE(HasFeature(features, NodeFeature::DOUBLE));
	EXPECT_FALSE(HasFeature(features, NodeFeature::GEO));
	EXPECT_FALSE(HasFeature(features, NodeFeature::PARTITION_SCAN));

	EXPECT_EQ(ParseFeatures(""), 0u);
}

TEST(TestInfo, PartitionId)
{
	Digest digest{};
	EXPECT_EQ(GetPartitionId(digest), 0u);

	digest[0] = 0x34;
	digest[1] = 0x12;
	EXPECT_EQ(GetPartitionId(digest), 0x1234u % PARTITIONS);

	/* only the first four bytes are significant */
	digest[19] = 0xff;
	EXPECT_EQ(GetPartitionId(digest), 0x1234u % PARTITIONS);

	digest[2] = 1;
	EXPECT_EQ(GetPartitionId(digest), 0x11234u % PARTITIONS);

	EXPECT_EQ(Partition::FromDigest("test", digest).id, 0x11234u % PARTITIONS);
}

TEST(TestInfo, Errors)
{
	EXPECT_TRUE(ClusterError(ResultCode::TIMEOUT).IsRetryable());
	EXPECT_TRUE(ConnectionError("refused").IsRetryable());
	EXPECT_FALSE(ParseError("bad").IsRetryable());
	EXPECT_FALSE(ClusterError(ResultCode::INVALID_NODE_ERROR).IsRetryable());

	EXPECT_STREQ(ClusterError(ResultCode::PARTITION_UNAVAILABLE).what(),
		     "Partition not available");

	const auto e = InvalidNodeError(17u);
	EXPECT_EQ(e.GetCode(), ResultCode::INVALID_NODE_ERROR);
	EXPECT_STREQ(e.what(), "Node not found for partition 17");

	EXPECT_STREQ(InvalidNamespaceError("test", 0).what(),
		     "Partition map empty");
	EXPECT_STREQ(InvalidNamespaceError("test", 2).what(),
		     "Namespace not found in partition map: test");
	EXPECT_EQ(InvalidNamespaceError("test", 2).GetCode(),
		  ResultCode::INVALID_NAMESPACE);
}
