// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <kvcluster/Protocol.hxx>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <span>
#include <string>
#include <string_view>

class Connection;

/**
 * The parsed response of an info request: command name to value.
 */
using InfoMap = std::map<std::string, std::string, std::less<>>;

/**
 * Build the body of an info request: each command followed by a
 * newline.
 */
std::string
MakeInfoRequest(std::span<const std::string_view> commands) noexcept;

std::string
MakeInfoRequest(std::initializer_list<std::string_view> commands) noexcept;

/**
 * Prepend a #KvCluster::InfoHeader to the given body.
 */
std::string
EncodeInfoMessage(std::string_view body) noexcept;

/**
 * Check the header and return the body length.
 *
 * Throws #ClusterError (PARSE_ERROR) on a malformed header.
 */
uint64_t
DecodeInfoHeader(const KvCluster::InfoHeader &header);

/**
 * Split a response body into name/value pairs.  Each line is
 * "name\tvalue"; a line without a tab has an empty value.
 */
InfoMap
ParseInfoResponse(std::string_view body) noexcept;

/**
 * Send the commands over the connection and parse the response.
 *
 * Throws on error.
 */
InfoMap
InfoRequest(Connection &connection,
	    std::span<const std::string_view> commands);

InfoMap
InfoRequest(Connection &connection,
	    std::initializer_list<std::string_view> commands);

/**
 * Send one command and return its value.
 *
 * Throws #ClusterError (PARSE_ERROR) if the response does not
 * contain the command.
 */
std::string
InfoRequest(Connection &connection, std::string_view command);

/**
 * Look up a mandatory value in an #InfoMap.
 *
 * Throws #ClusterError (PARSE_ERROR) if it is missing or empty.
 */
const std::string &
GetInfoValue(const InfoMap &map, std::string_view name);

/**
 * Parse a decimal (possibly negative) integer value.
 *
 * Throws #ClusterError (PARSE_ERROR) on error.
 */
int64_t
ParseInfoInteger(std::string_view name, std::string_view value);
