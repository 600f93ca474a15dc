// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Host.hxx"
#include "Error.hxx"
#include "util/StringUtil.hxx"

#include <fmt/format.h>

#include <charconv>
#include <functional>

std::string
Host::ToString() const noexcept
{
	if (name.find(':') != name.npos)
		return fmt::format("[{}] {}", name, port);

	return fmt::format("{} {}", name, port);
}

std::size_t
Host::Hash::operator()(const Host &host) const noexcept
{
	std::size_t h = std::hash<std::string>{}(host.name);
	return h * 31 + host.port;
}

static bool
ParsePort(std::string_view s, unsigned &port) noexcept
{
	s = Strip(s);
	if (s.empty())
		return false;

	unsigned value;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{} || ptr != s.data() + s.size() ||
	    value == 0 || value > 65535)
		return false;

	port = value;
	return true;
}

/**
 * Parse one "host[:tlsname][:port]" entry.
 */
static Host
ParseHostEntry(std::string_view entry, unsigned default_port)
{
	const std::string_view original = entry;
	entry = Strip(entry);

	std::string_view name;
	if (!entry.empty() && entry.front() == '[') {
		/* IPv6 address in brackets */
		const auto end = entry.find(']');
		if (end == entry.npos)
			throw FmtClusterError(ResultCode::PARAMETER_ERROR,
					      "Unterminated IPv6 address: {}",
					      original);

		name = entry.substr(1, end - 1);
		entry = entry.substr(end + 1);
	} else {
		const auto colon = entry.find(':');
		name = entry.substr(0, colon);
		entry = colon == entry.npos
			? std::string_view{}
			: entry.substr(colon);
	}

	if (name.empty())
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "Invalid host: {}", original);

	std::string_view tls_name;
	unsigned port = default_port;

	if (!entry.empty()) {
		if (entry.front() != ':')
			throw FmtClusterError(ResultCode::PARAMETER_ERROR,
					      "Invalid host: {}", original);

		entry.remove_prefix(1);

		const auto colon = entry.find(':');
		if (colon != entry.npos) {
			tls_name = entry.substr(0, colon);
			if (!ParsePort(entry.substr(colon + 1), port))
				throw FmtClusterError(ResultCode::PARAMETER_ERROR,
						      "Invalid port: {}",
						      original);
		} else if (!ParsePort(entry, port)) {
			/* not a number: it's the TLS name and the
			   default port applies */
			tls_name = entry;
		}
	}

	if (port == 0)
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "Missing port: {}", original);

	return {name, tls_name, port};
}

std::vector<Host>
ParseHosts(std::string_view s, unsigned default_port)
{
	std::vector<Host> hosts;

	for (const auto entry : SplitString(s, ',')) {
		if (Strip(entry).empty())
			continue;

		hosts.emplace_back(ParseHostEntry(entry, default_port));
	}

	if (hosts.empty())
		throw FmtClusterError(ResultCode::PARAMETER_ERROR,
				      "No hosts in '{}'", s);

	return hosts;
}

std::vector<Host>
ParseServiceHosts(std::string_view s)
{
	std::vector<Host> hosts;

	for (auto entry : SplitString(s, ';')) {
		entry = Strip(entry);
		if (entry.empty())
			continue;

		const auto colon = entry.rfind(':');
		unsigned port;
		if (colon == entry.npos || !ParsePort(entry.substr(colon + 1), port))
			throw FmtClusterError(ResultCode::PARSE_ERROR,
					      "Invalid service host: {}", entry);

		auto name = entry.substr(0, colon);
		if (name.size() >= 2 && name.front() == '[' && name.back() == ']')
			name = name.substr(1, name.size() - 2);

		if (name.empty())
			throw FmtClusterError(ResultCode::PARSE_ERROR,
					      "Invalid service host: {}", entry);

		hosts.emplace_back(name, port);
	}

	return hosts;
}
