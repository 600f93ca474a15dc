// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Definitions for the cluster info protocol and the result codes
 * reported by servers and by the client runtime.
 */

#pragma once

#include <cstdint>

namespace KvCluster {

/**
 * The number of partitions of each namespace.
 */
static constexpr unsigned PARTITIONS = 4096;

/**
 * The maximum length of a namespace name (excluding the null
 * terminator).
 */
static constexpr unsigned MAX_NAMESPACE_LENGTH = 31;

static constexpr uint8_t INFO_PROTOCOL_VERSION = 2;
static constexpr uint8_t INFO_MESSAGE_TYPE = 1;

/**
 * Every info message starts with this header.  The body length is a
 * 48 bit big-endian integer.
 */
struct InfoHeader {
	uint8_t version;
	uint8_t type;
	uint8_t length[6];
};

static_assert(sizeof(InfoHeader) == 8);

/**
 * Info responses larger than this are rejected.
 */
static constexpr uint64_t MAX_INFO_BODY = 16 * 1024 * 1024;

enum class ResultCode : int {
	/**
	 * A transaction on the stream was rejected because the cluster
	 * has reached its error rate limit.
	 */
	MAX_ERROR_RATE = -12,

	MAX_RETRIES_EXCEEDED = -11,
	SERIALIZE_ERROR = -10,

	/**
	 * The server was not reachable, or a socket operation failed.
	 */
	SERVER_NOT_AVAILABLE = -8,

	NO_MORE_CONNECTIONS = -7,
	COMMAND_REJECTED = -6,
	QUERY_TERMINATED = -5,
	SCAN_TERMINATED = -4,

	/**
	 * No eligible node could be found for the request.
	 */
	INVALID_NODE_ERROR = -3,

	PARSE_ERROR = -2,
	CLIENT_ERROR = -1,

	OK = 0,

	SERVER_ERROR = 1,
	PARAMETER_ERROR = 4,
	TIMEOUT = 9,
	PARTITION_UNAVAILABLE = 11,
	INVALID_NAMESPACE = 20,
	NOT_AUTHENTICATED = 80,
	INDEX_NOTFOUND = 201,
	INDEX_NOTREADABLE = 203,
	QUERY_ABORTED = 210,
};

} // namespace KvCluster
