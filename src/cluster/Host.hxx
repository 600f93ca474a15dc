// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <fmt/core.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/**
 * The address of a server: a host name (or numeric address), the
 * name expected in its TLS certificate and a port.  Two hosts are
 * equal if name and port are equal.
 */
struct Host {
	std::string name;
	std::string tls_name;
	unsigned port;

	Host(std::string_view _name, unsigned _port) noexcept
		:name(_name), port(_port) {}

	Host(std::string_view _name, std::string_view _tls_name,
	     unsigned _port) noexcept
		:name(_name), tls_name(_tls_name), port(_port) {}

	bool operator==(const Host &other) const noexcept {
		return port == other.port && name == other.name;
	}

	bool operator!=(const Host &other) const noexcept {
		return !(*this == other);
	}

	/**
	 * Format as "name port"; IPv6 addresses are enclosed in square
	 * brackets.
	 */
	[[gnu::pure]]
	std::string ToString() const noexcept;

	struct Hash {
		[[gnu::pure]]
		std::size_t operator()(const Host &host) const noexcept;
	};
};

/**
 * Parse a comma-separated list of "host[:tlsname][:port]" entries.
 * IPv6 addresses must be enclosed in square brackets.
 *
 * Throws #ClusterError (PARAMETER_ERROR) on syntax errors.
 */
std::vector<Host>
ParseHosts(std::string_view s, unsigned default_port);

/**
 * Parse the semicolon-separated "host:port" list returned by the
 * "services" info commands.
 *
 * Throws #ClusterError (PARSE_ERROR) on syntax errors.
 */
std::vector<Host>
ParseServiceHosts(std::string_view s);

template<>
struct fmt::formatter<Host> : fmt::formatter<std::string_view> {
	template<typename FormatContext>
	auto format(const Host &host, FormatContext &ctx) const {
		return fmt::formatter<std::string_view>::format(host.ToString(),
								 ctx);
	}
};
