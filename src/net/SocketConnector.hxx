// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "cluster/Connection.hxx"

/**
 * A #Connection over a plain TCP socket.
 */
class SocketConnection final : public Connection {
	int fd;

public:
	/**
	 * Takes ownership of the connected socket.
	 */
	explicit SocketConnection(int _fd) noexcept
		:fd(_fd) {}

	~SocketConnection() noexcept override {
		Close();
	}

	/* virtual methods from class Connection */
	std::string Info(std::string_view request) override;

	bool IsValid() const noexcept override {
		return fd >= 0;
	}

	void Close() noexcept override;

private:
	void SendAll(const char *data, std::size_t size);
	void ReceiveAll(char *data, std::size_t size);
};

/**
 * A #Connector using getaddrinfo() and plain TCP sockets.  It does
 * not implement TLS or authentication; both are rejected with an
 * error.
 */
class SocketConnector final : public Connector {
public:
	/* virtual methods from class Connector */
	std::vector<std::string> Resolve(const Host &host) override;
	std::unique_ptr<Connection> Connect(const Host &address,
					    std::chrono::milliseconds timeout) override;
};
