// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <kvcluster/Protocol.hxx>

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>

using KvCluster::ResultCode;

[[gnu::const]]
const char *
ToString(ResultCode code) noexcept;

/**
 * An error reported by the cluster runtime or by a server, carrying
 * a #ResultCode which allows callers to decide whether a retry is
 * worthwhile.
 */
class ClusterError : public std::runtime_error {
	ResultCode code;

public:
	ClusterError(ResultCode _code, const std::string &_msg) noexcept
		:std::runtime_error(_msg), code(_code) {}

	explicit ClusterError(ResultCode _code) noexcept
		:std::runtime_error(ToString(_code)), code(_code) {}

	ResultCode GetCode() const noexcept {
		return code;
	}

	/**
	 * Does this error indicate a transient condition which may go
	 * away after the partition map has been refreshed?
	 */
	[[gnu::pure]]
	bool IsRetryable() const noexcept;
};

[[nodiscard]]
ClusterError
VFmtClusterError(ResultCode code,
		 fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename... Args>
[[nodiscard]]
auto
FmtClusterError(ResultCode code, fmt::format_string<Args...> format_str,
		Args&&... args) noexcept
{
	return VFmtClusterError(code, format_str,
				fmt::make_format_args(args...));
}

[[nodiscard]]
inline ClusterError
ConnectionError(std::string_view msg) noexcept
{
	return ClusterError(ResultCode::SERVER_NOT_AVAILABLE, std::string{msg});
}

[[nodiscard]]
inline ClusterError
ParseError(std::string_view msg) noexcept
{
	return ClusterError(ResultCode::PARSE_ERROR, std::string{msg});
}

[[nodiscard]]
inline ClusterError
InvalidNodeError(std::string_view msg) noexcept
{
	return ClusterError(ResultCode::INVALID_NODE_ERROR, std::string{msg});
}

/**
 * No master node is known for the given partition.
 */
[[nodiscard]]
ClusterError
InvalidNodeError(unsigned partition_id) noexcept;

/**
 * The namespace is not in the partition map.
 */
[[nodiscard]]
ClusterError
InvalidNamespaceError(std::string_view ns, std::size_t map_size) noexcept;
