// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "AddressInfo.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <sys/socket.h>

AddressInfo
Resolve(const char *host, const char *service, int flags)
{
	struct addrinfo hints{};
	hints.ai_flags = flags;
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	struct addrinfo *ai;
	int result = getaddrinfo(host, service, &hints, &ai);
	if (result != 0)
		throw FmtRuntimeError("Failed to resolve '{}': {}",
				      host, gai_strerror(result));

	return AddressInfo(ai);
}

std::string
ToNumericHost(const struct addrinfo &ai)
{
	char buffer[NI_MAXHOST];
	int result = getnameinfo(ai.ai_addr, ai.ai_addrlen,
				 buffer, sizeof(buffer), nullptr, 0,
				 NI_NUMERICHOST);
	if (result != 0)
		throw FmtRuntimeError("Failed to format address: {}",
				      gai_strerror(result));

	return buffer;
}
