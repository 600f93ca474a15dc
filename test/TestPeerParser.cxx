// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "cluster/PeerParser.hxx"
#include "cluster/Peers.hxx"
#include "cluster/Config.hxx"
#include "cluster/Error.hxx"

#include <gtest/gtest.h>

static ResultCode
CatchParsePeers(const char *response)
{
	ClusterConfig config;
	std::vector<Peer> peers;

	try {
		ParsePeers(response, config, peers);
	} catch (const ClusterError &e) {
		return e.GetCode();
	}

	return ResultCode::OK;
}

TEST(TestPeerParser, Empty)
{
	ClusterConfig config;
	std::vector<Peer> peers;
	peers.emplace_back();

	EXPECT_EQ(ParsePeers("12,3000,[]", config, peers), 12);
	EXPECT_TRUE(peers.empty());
}

TEST(TestPeerParser, Basic)
{
	ClusterConfig config;
	std::vector<Peer> peers;

	EXPECT_EQ(ParsePeers("3,3100,[[BB9,,[10.0.0.2]],[BB7,tls7,[10.0.0.3:4000,[2001:db8::1]:4001,[::2]]]]\n",
			     config, peers),
		  3);
	ASSERT_EQ(peers.size(), 2u);

	EXPECT_EQ(peers[0].node_name, "BB9");
	EXPECT_TRUE(peers[0].tls_name.empty());
	ASSERT_EQ(peers[0].hosts.size(), 1u);
	EXPECT_EQ(peers[0].hosts[0], Host("10.0.0.2", 3100));

	EXPECT_EQ(peers[1].node_name, "BB7");

	/* TLS is disabled: the TLS name is ignored */
	EXPECT_TRUE(peers[1].tls_name.empty());

	ASSERT_EQ(peers[1].hosts.size(), 3u);
	EXPECT_EQ(peers[1].hosts[0], Host("10.0.0.3", 4000));
	EXPECT_EQ(peers[1].hosts[1], Host("2001:db8::1", 4001));
	EXPECT_EQ(peers[1].hosts[2], Host("::2", 3100));
}

TEST(TestPeerParser, TlsAndAddressMap)
{
	ClusterConfig config;
	config.tls = true;
	config.ip_map.emplace("192.168.1.1", "10.0.0.1");

	EXPECT_STREQ(GetPeersCommand(config), "peers-tls-std");

	std::vector<Peer> peers;
	ParsePeers("1,4333,[[A,node-a.example.com,[192.168.1.1]]]", config, peers);
	ASSERT_EQ(peers.size(), 1u);
	EXPECT_EQ(peers[0].tls_name, "node-a.example.com");
	ASSERT_EQ(peers[0].hosts.size(), 1u);
	EXPECT_EQ(peers[0].hosts[0].name, "10.0.0.1");
	EXPECT_EQ(peers[0].hosts[0].tls_name, "node-a.example.com");
	EXPECT_EQ(peers[0].hosts[0].port, 4333u);
}

TEST(TestPeerParser, Command)
{
	ClusterConfig config;
	EXPECT_STREQ(GetPeersCommand(config), "peers-clear-std");

	config.use_services_alternate = true;
	EXPECT_STREQ(GetPeersCommand(config), "peers-clear-alt");

	config.tls = true;
	EXPECT_STREQ(GetPeersCommand(config), "peers-tls-alt");
}

TEST(TestPeerParser, Malformed)
{
	EXPECT_EQ(CatchParsePeers(""), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("x,3000,[]"), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("1,3000"), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("1,99999,[]"), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("1,3000,[[A,,[10.0.0.1]]"), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("1,3000,[[,,[10.0.0.1]]]"), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("1,3000,[[A,,[10.0.0.1:0]]]"), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("1,3000,[[A,,[[::1]]]"), ResultCode::PARSE_ERROR);
	EXPECT_EQ(CatchParsePeers("1,3000,[[A,,[]]]"), ResultCode::OK);
}
