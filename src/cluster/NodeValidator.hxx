// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Host.hxx"

#include <memory>
#include <string>
#include <vector>

struct ClusterConfig;
class Connector;
class Connection;
class Logger;

/**
 * Connects to a candidate host and checks whether it is a usable
 * cluster node.  On success, the fields describe the node and own
 * its first connection, which becomes the node's tend connection.
 */
class NodeValidator {
	const ClusterConfig &config;
	Connector &connector;
	const Logger &logger;

public:
	std::string name;

	/**
	 * The numeric addresses of the host.
	 */
	std::vector<Host> aliases;

	/**
	 * The host as it was configured or announced.
	 */
	Host primary_host{std::string_view{}, 0};

	/**
	 * The numeric address which was validated.
	 */
	Host primary_address{std::string_view{}, 0};

	std::unique_ptr<Connection> connection;

	/**
	 * Bit mask of #NodeFeature values.
	 */
	unsigned features = 0;

	NodeValidator(const ClusterConfig &_config, Connector &_connector,
		      const Logger &_logger) noexcept;
	~NodeValidator() noexcept;

	NodeValidator(const NodeValidator &) = delete;
	NodeValidator &operator=(const NodeValidator &) = delete;

	/**
	 * Resolve the host name and initialize #aliases.
	 *
	 * Throws on error.
	 *
	 * @return the numeric addresses (never empty)
	 */
	std::vector<std::string> ResolveAliases(const Host &host);

	/**
	 * Validate one of the addresses returned by ResolveAliases().
	 *
	 * Throws on error.
	 */
	void ValidateAddress(const Host &host, std::string_view address);

	/**
	 * Resolve the host name and try all of its addresses until one
	 * validates.
	 *
	 * Throws the error of the first address if none works.
	 */
	void ValidateNode(const Host &host);
};
