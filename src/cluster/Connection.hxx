// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct Host;
struct ClusterConfig;

/**
 * A connection to one server node.  Implementations are not
 * thread-safe; a connection is used by one thread at a time (it is
 * either owned by a node's tend code or borrowed from a pool).
 */
class Connection {
	std::chrono::steady_clock::time_point last_used =
		std::chrono::steady_clock::now();

public:
	virtual ~Connection() noexcept = default;

	Connection() = default;
	Connection(const Connection &) = delete;
	Connection &operator=(const Connection &) = delete;

	std::chrono::steady_clock::time_point GetLastUsed() const noexcept {
		return last_used;
	}

	void UpdateLastUsed() noexcept {
		last_used = std::chrono::steady_clock::now();
	}

	/**
	 * Send an info request (newline-terminated command names)
	 * and return the response body.
	 *
	 * Throws on error; the connection is not valid afterwards.
	 */
	virtual std::string Info(std::string_view request) = 0;

	virtual bool IsValid() const noexcept = 0;

	virtual void Close() noexcept = 0;
};

/**
 * Creates connections.  This is the seam between the cluster
 * runtime and the network.
 */
class Connector {
public:
	virtual ~Connector() noexcept = default;

	/**
	 * Resolve the host name to a list of numeric addresses.  The
	 * result is never empty.
	 *
	 * Throws on error.
	 */
	virtual std::vector<std::string> Resolve(const Host &host) = 0;

	/**
	 * Open a connection to the given numeric address.  If
	 * #Host::tls_name is set, the connection must be secured with
	 * TLS and the certificate must match that name.
	 *
	 * Throws on error.
	 */
	virtual std::unique_ptr<Connection> Connect(const Host &address,
						    std::chrono::milliseconds timeout) = 0;

	/**
	 * Authenticate a fresh connection with the credentials from the
	 * configuration.  The default implementation throws
	 * NOT_AUTHENTICATED.
	 */
	virtual void Login(Connection &connection,
			   const ClusterConfig &config);
};
