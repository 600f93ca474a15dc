// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Host.hxx"

#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

class Node;

/**
 * One entry of a node's peer list.
 */
struct Peer {
	std::string node_name;
	std::string tls_name;
	std::vector<Host> hosts;
};

/**
 * Scratch state of one tend cycle: the peers discovered so far and
 * the nodes which shall be added at the end of the cycle.
 */
struct Peers {
	/**
	 * The peer list of the node being parsed.
	 */
	std::vector<Peer> peers;

	/**
	 * Hosts which have been probed in this cycle.
	 */
	std::unordered_set<Host, Host::Hash> hosts;

	/**
	 * Nodes validated in this cycle, to be added to the cluster.
	 */
	std::map<std::string, std::shared_ptr<Node>, std::less<>> nodes;

private:
	/**
	 * Hosts whose validation has failed in this cycle; they are
	 * not tried again until the next cycle.
	 */
	std::unordered_set<Host, Host::Hash> invalid_hosts;

public:
	/**
	 * The number of nodes which have been refreshed successfully
	 * in the current phase.
	 */
	unsigned refresh_count = 0;

	/**
	 * Has the peers generation of any node changed?
	 */
	bool gen_changed = false;

	/**
	 * False if at least one node does not support the "peers"
	 * commands; nodes report their neighbours with "services"
	 * then.
	 */
	bool use_peers = true;

	explicit Peers(std::size_t capacity) noexcept {
		peers.reserve(capacity);
		hosts.reserve(capacity);
	}

	Peers(const Peers &) = delete;
	Peers &operator=(const Peers &) = delete;

	bool HasFailed(const Host &host) const noexcept {
		return invalid_hosts.find(host) != invalid_hosts.end();
	}

	void Fail(const Host &host) noexcept {
		invalid_hosts.emplace(host);
	}

	std::size_t GetInvalidCount() const noexcept {
		return invalid_hosts.size();
	}
};
