// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Error.hxx"

#include <fmt/format.h>

const char *
ToString(ResultCode code) noexcept
{
	switch (code) {
	case ResultCode::MAX_ERROR_RATE:
		return "Max error rate exceeded";

	case ResultCode::MAX_RETRIES_EXCEEDED:
		return "Max retries exceeded";

	case ResultCode::SERIALIZE_ERROR:
		return "Serialize error";

	case ResultCode::SERVER_NOT_AVAILABLE:
		return "Server not available";

	case ResultCode::NO_MORE_CONNECTIONS:
		return "No more available connections";

	case ResultCode::COMMAND_REJECTED:
		return "Command rejected";

	case ResultCode::QUERY_TERMINATED:
		return "Query terminated";

	case ResultCode::SCAN_TERMINATED:
		return "Scan terminated";

	case ResultCode::INVALID_NODE_ERROR:
		return "Invalid node";

	case ResultCode::PARSE_ERROR:
		return "Parse error";

	case ResultCode::CLIENT_ERROR:
		return "Client error";

	case ResultCode::OK:
		return "OK";

	case ResultCode::SERVER_ERROR:
		return "Server error";

	case ResultCode::PARAMETER_ERROR:
		return "Parameter error";

	case ResultCode::TIMEOUT:
		return "Timeout";

	case ResultCode::PARTITION_UNAVAILABLE:
		return "Partition not available";

	case ResultCode::INVALID_NAMESPACE:
		return "Namespace not found";

	case ResultCode::NOT_AUTHENTICATED:
		return "Not authenticated";

	case ResultCode::INDEX_NOTFOUND:
		return "Index not found";

	case ResultCode::INDEX_NOTREADABLE:
		return "Index not readable";

	case ResultCode::QUERY_ABORTED:
		return "Query aborted";
	}

	return "Unknown error";
}

bool
ClusterError::IsRetryable() const noexcept
{
	switch (code) {
	case ResultCode::SERVER_NOT_AVAILABLE:
	case ResultCode::TIMEOUT:
	case ResultCode::INDEX_NOTFOUND:
	case ResultCode::INDEX_NOTREADABLE:
		return true;

	default:
		return false;
	}
}

ClusterError
VFmtClusterError(ResultCode code,
		 fmt::string_view format_str, fmt::format_args args) noexcept
{
	return ClusterError(code, fmt::vformat(format_str, args));
}

ClusterError
InvalidNodeError(unsigned partition_id) noexcept
{
	return FmtClusterError(ResultCode::INVALID_NODE_ERROR,
			       "Node not found for partition {}",
			       partition_id);
}

ClusterError
InvalidNamespaceError(std::string_view ns, std::size_t map_size) noexcept
{
	if (map_size == 0)
		return ClusterError(ResultCode::INVALID_NAMESPACE,
				    "Partition map empty");

	return FmtClusterError(ResultCode::INVALID_NAMESPACE,
			       "Namespace not found in partition map: {}",
			       ns);
}
