// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Host.hxx"

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * The default port of cluster nodes.
 */
static constexpr unsigned DEFAULT_NODE_PORT = 3000;

/**
 * Client-side policy for one cluster.
 */
struct ClusterConfig {
	/**
	 * The expected cluster name.  If set, nodes reporting a
	 * different name are rejected.  It is also the default TLS
	 * name of seeds.
	 */
	std::string name;

	std::vector<Host> seeds;

	std::string user, password;

	/**
	 * Translate addresses received in peer lists.
	 */
	std::map<std::string, std::string, std::less<>> ip_map;

	std::chrono::milliseconds connect_timeout{1000};
	std::chrono::milliseconds login_timeout{5000};
	std::chrono::milliseconds tend_interval{1000};

	/**
	 * Pooled connections idle longer than this are closed.
	 */
	std::chrono::seconds max_socket_idle{55};

	unsigned min_connections = 0;
	unsigned max_connections = 300;
	unsigned connection_pools = 1;

	/**
	 * A node is removed after this many consecutive refresh
	 * failures.
	 */
	unsigned max_failures = 5;

	/**
	 * The maximum number of tend cycles run at startup until the
	 * node count stops changing.
	 */
	unsigned stabilize_cycles = 3;

	/**
	 * The number of worker threads for scans and queries.
	 */
	unsigned worker_threads = 8;

	/**
	 * Maximum connection errors per node within #error_rate_window
	 * tend cycles; 0 disables the limit.
	 */
	unsigned max_error_rate = 0;
	unsigned error_rate_window = 1;

	/**
	 * Throw if no seed could be reached at startup (or the cluster
	 * did not stabilize)?
	 */
	bool fail_if_not_connected = true;

	/**
	 * Use the "-alt" variants of the peers/services info commands.
	 */
	bool use_services_alternate = false;

	bool tls = false;

	/**
	 * Track the rack of each node and allow
	 * ReplicaPolicy::PREFER_RACK to prefer nodes on the racks
	 * listed in #rack_ids.
	 */
	bool rack_aware = false;

	/**
	 * The racks of this client, in order of preference.
	 */
	std::vector<unsigned> rack_ids;

	bool IsAuthEnabled() const noexcept {
		return !user.empty();
	}

	/**
	 * Look up an address in #ip_map, returning the input if there
	 * is no mapping.
	 */
	[[gnu::pure]]
	std::string_view MapAddress(std::string_view address) const noexcept {
		auto i = ip_map.find(address);
		return i != ip_map.end() ? std::string_view{i->second} : address;
	}

	/**
	 * Throws std::runtime_error if the configuration is not
	 * usable.
	 */
	void Check() const;

	/**
	 * Handle a "--set NAME=VALUE" command line option.
	 *
	 * Throws on error.
	 */
	void HandleSet(std::string_view name, const char *value);
};
