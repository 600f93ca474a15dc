// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SocketConnector.hxx"
#include "AddressInfo.hxx"
#include "cluster/Host.hxx"
#include "cluster/Info.hxx"
#include "cluster/Error.hxx"
#include "system/Error.hxx"

#include <algorithm>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

void
SocketConnection::Close() noexcept
{
	if (fd >= 0) {
		close(fd);
		fd = -1;
	}
}

void
SocketConnection::SendAll(const char *data, std::size_t size)
{
	while (size > 0) {
		ssize_t nbytes = send(fd, data, size, MSG_NOSIGNAL);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			if (errno == EAGAIN)
				throw ClusterError(ResultCode::TIMEOUT,
						   "Timeout while sending info request");

			throw MakeErrno("Failed to send info request");
		}

		data += nbytes;
		size -= nbytes;
	}
}

void
SocketConnection::ReceiveAll(char *data, std::size_t size)
{
	while (size > 0) {
		ssize_t nbytes = recv(fd, data, size, 0);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			if (errno == EAGAIN)
				throw ClusterError(ResultCode::TIMEOUT,
						   "Timeout while receiving info response");

			throw MakeErrno("Failed to receive info response");
		}

		if (nbytes == 0)
			throw ConnectionError("Server closed the connection");

		data += nbytes;
		size -= nbytes;
	}
}

std::string
SocketConnection::Info(std::string_view request)
{
	if (fd < 0)
		throw ConnectionError("Connection is closed");

	try {
		const auto message = EncodeInfoMessage(request);
		SendAll(message.data(), message.size());

		KvCluster::InfoHeader header;
		ReceiveAll((char *)&header, sizeof(header));

		std::string body(DecodeInfoHeader(header), '\0');
		ReceiveAll(body.data(), body.size());
		return body;
	} catch (...) {
		Close();
		throw;
	}
}

std::vector<std::string>
SocketConnector::Resolve(const Host &host)
{
	std::vector<std::string> result;

	try {
		for (const auto &ai : ::Resolve(host.name.c_str(), nullptr,
						AI_ADDRCONFIG)) {
			auto address = ToNumericHost(ai);
			if (std::find(result.begin(), result.end(), address) == result.end())
				result.emplace_back(std::move(address));
		}
	} catch (...) {
		std::throw_with_nested(ConnectionError(host.ToString()));
	}

	if (result.empty())
		throw FmtClusterError(ResultCode::SERVER_NOT_AVAILABLE,
				      "No addresses for {}", host);

	return result;
}

static void
SetTimeout(int fd, int option, std::chrono::milliseconds timeout)
{
	struct timeval tv{};
	tv.tv_sec = timeout.count() / 1000;
	tv.tv_usec = (timeout.count() % 1000) * 1000;
	if (setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0)
		throw MakeErrno("Failed to set socket timeout");
}

static void
WaitConnected(int fd, std::chrono::milliseconds timeout)
{
	struct pollfd pfd{};
	pfd.fd = fd;
	pfd.events = POLLOUT;

	int result;
	do {
		result = poll(&pfd, 1, int(timeout.count()));
	} while (result < 0 && errno == EINTR);

	if (result < 0)
		throw MakeErrno("poll() failed");

	if (result == 0)
		throw ClusterError(ResultCode::TIMEOUT, "Connect timeout");

	int error = 0;
	socklen_t length = sizeof(error);
	if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) < 0)
		throw MakeErrno("getsockopt() failed");

	if (error != 0)
		throw MakeErrno(error, "Failed to connect");
}

std::unique_ptr<Connection>
SocketConnector::Connect(const Host &address,
			 std::chrono::milliseconds timeout)
{
	if (!address.tls_name.empty())
		throw FmtClusterError(ResultCode::CLIENT_ERROR,
				      "TLS connection to {} requested, but TLS is not supported",
				      address);

	const auto port = std::to_string(address.port);

	try {
		const auto ai = ::Resolve(address.name.c_str(), port.c_str(),
					  AI_NUMERICHOST|AI_NUMERICSERV);
		const auto &first = *ai.begin();

		int fd = socket(first.ai_family,
				first.ai_socktype|SOCK_CLOEXEC|SOCK_NONBLOCK,
				first.ai_protocol);
		if (fd < 0)
			throw MakeErrno("Failed to create socket");

		auto connection = std::make_unique<SocketConnection>(fd);

		if (connect(fd, first.ai_addr, first.ai_addrlen) < 0) {
			if (errno != EINPROGRESS)
				throw MakeErrno("Failed to connect");

			WaitConnected(fd, timeout);
		}

		/* switch back to blocking mode; the socket timeouts bound
		   all further I/O */
		fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) & ~O_NONBLOCK);
		SetTimeout(fd, SO_SNDTIMEO, timeout);
		SetTimeout(fd, SO_RCVTIMEO, timeout);

		return connection;
	} catch (...) {
		std::throw_with_nested(FmtClusterError(ResultCode::SERVER_NOT_AVAILABLE,
						       "Failed to connect to {}",
						       address));
	}
}
