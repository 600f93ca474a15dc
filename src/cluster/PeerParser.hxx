// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

struct ClusterConfig;
struct Peer;

/**
 * The info command which returns the peer list in the address
 * flavor selected by the configuration.
 */
[[gnu::pure]]
const char *
GetPeersCommand(const ClusterConfig &config) noexcept;

/**
 * Parse the value of a "peers-*" info command:
 *
 *     GEN,DEFAULT_PORT,[[NAME,TLSNAME,[HOST[:PORT],...]],...]
 *
 * IPv6 addresses are enclosed in square brackets.  Host names are
 * translated with the configured address map.  The previous
 * contents of #peers are replaced.
 *
 * Throws #ClusterError (PARSE_ERROR) on syntax errors.
 *
 * @return the peers generation
 */
int64_t
ParsePeers(std::string_view response, const ClusterConfig &config,
	   std::vector<Peer> &peers);
