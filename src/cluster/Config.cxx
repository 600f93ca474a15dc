// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Config.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringParser.hxx"

#include <stdexcept>

void
ClusterConfig::Check() const
{
	if (seeds.empty())
		throw std::runtime_error("No seeds configured");

	if (tend_interval.count() <= 0)
		throw std::runtime_error("Invalid tend interval");

	if (max_connections == 0)
		throw std::runtime_error("max_connections must be positive");

	if (min_connections > max_connections)
		throw FmtRuntimeError("min_connections {} exceeds max_connections {}",
				      min_connections, max_connections);

	if (connection_pools == 0 || connection_pools > max_connections)
		throw FmtRuntimeError("Invalid connection_pools {}",
				      connection_pools);

	if (max_failures == 0)
		throw std::runtime_error("max_failures must be positive");

	if (stabilize_cycles == 0)
		throw std::runtime_error("stabilize_cycles must be positive");

	if (!password.empty() && user.empty())
		throw std::runtime_error("Password without user");

	if (rack_aware && rack_ids.empty())
		throw std::runtime_error("rack_aware requires a rack_id");
}

void
ClusterConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "cluster_name")
		this->name = value;
	else if (name == "tend_interval")
		tend_interval = std::chrono::milliseconds(ParseUnsignedLong(value));
	else if (name == "connect_timeout")
		connect_timeout = std::chrono::milliseconds(ParseUnsignedLong(value));
	else if (name == "login_timeout")
		login_timeout = std::chrono::milliseconds(ParseUnsignedLong(value));
	else if (name == "max_socket_idle")
		max_socket_idle = std::chrono::seconds(ParseUnsignedLong(value));
	else if (name == "min_connections")
		min_connections = ParseUnsignedLong(value);
	else if (name == "max_connections")
		max_connections = ParseUnsignedLong(value);
	else if (name == "connection_pools")
		connection_pools = ParseUnsignedLong(value);
	else if (name == "max_failures")
		max_failures = ParseUnsignedLong(value);
	else if (name == "stabilize_cycles")
		stabilize_cycles = ParseUnsignedLong(value);
	else if (name == "worker_threads")
		worker_threads = ParseUnsignedLong(value);
	else if (name == "max_error_rate")
		max_error_rate = ParseUnsignedLong(value);
	else if (name == "error_rate_window")
		error_rate_window = ParseUnsignedLong(value);
	else if (name == "fail_if_not_connected")
		fail_if_not_connected = ParseBool(value);
	else if (name == "services_alternate")
		use_services_alternate = ParseBool(value);
	else if (name == "rack_aware")
		rack_aware = ParseBool(value);
	else if (name == "rack_id")
		rack_ids = {unsigned(ParseUnsignedLong(value))};
	else
		throw std::runtime_error("Unknown variable");
}
