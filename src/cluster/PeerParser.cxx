// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PeerParser.hxx"
#include "Peers.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "util/StringUtil.hxx"

#include <charconv>

namespace {

/**
 * A cursor over a peers response.
 */
class PeerParser {
	const ClusterConfig &config;

	const std::string_view response;
	std::string_view::size_type position = 0;

	unsigned default_port;

public:
	PeerParser(const ClusterConfig &_config,
		   std::string_view _response) noexcept
		:config(_config), response(_response) {}

	int64_t Parse(std::vector<Peer> &peers);

private:
	bool IsEnd() const noexcept {
		return position >= response.size();
	}

	char Peek() const noexcept {
		return IsEnd() ? '\0' : response[position];
	}

	bool SkipSymbol(char ch) noexcept {
		if (Peek() != ch)
			return false;

		++position;
		return true;
	}

	void Expect(char ch);

	/**
	 * Read up to (not including) one of the given delimiters.
	 */
	std::string_view ReadUntil(std::string_view delimiters) noexcept;

	int64_t ReadInteger();

	Peer ParsePeer();
	std::vector<Host> ParseHostList(const std::string &tls_name);
	Host ParseHost(const std::string &tls_name);

	[[gnu::pure]]
	std::string_view GetTruncatedResponse() const noexcept {
		return response.substr(0, 200);
	}
};

void
PeerParser::Expect(char ch)
{
	if (!SkipSymbol(ch))
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Expected '{}' at offset {} in response: {}",
				      ch, position, GetTruncatedResponse());
}

std::string_view
PeerParser::ReadUntil(std::string_view delimiters) noexcept
{
	const auto begin = position;
	while (!IsEnd() && delimiters.find(response[position]) == delimiters.npos)
		++position;

	return response.substr(begin, position - begin);
}

int64_t
PeerParser::ReadInteger()
{
	const auto s = ReadUntil(",:]");

	int64_t value;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Malformed number '{}' in response: {}",
				      s, GetTruncatedResponse());

	return value;
}

Host
PeerParser::ParseHost(const std::string &tls_name)
{
	std::string_view name;

	if (SkipSymbol('[')) {
		/* IPv6 address */
		name = ReadUntil("]");
		Expect(']');
	} else
		name = ReadUntil(":,]");

	name = config.MapAddress(name);

	switch (Peek()) {
	case ':': {
		++position;
		const auto port = ReadInteger();
		if (port <= 0 || port > 0xffff)
			throw FmtClusterError(ResultCode::PARSE_ERROR,
					      "Invalid port in response: {}",
					      GetTruncatedResponse());

		return {name, tls_name, unsigned(port)};
	}

	case ',':
	case ']':
		return {name, tls_name, default_port};

	default:
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Unterminated host in response: {}",
				      GetTruncatedResponse());
	}
}

std::vector<Host>
PeerParser::ParseHostList(const std::string &tls_name)
{
	std::vector<Host> hosts;
	Expect('[');

	if (SkipSymbol(']'))
		return hosts;

	while (true) {
		hosts.emplace_back(ParseHost(tls_name));

		if (SkipSymbol(']'))
			return hosts;

		Expect(',');
	}
}

Peer
PeerParser::ParsePeer()
{
	Peer peer;

	Expect('[');
	peer.node_name = ReadUntil(",");
	Expect(',');

	const auto tls_name = ReadUntil(",");
	if (config.tls)
		peer.tls_name = tls_name;
	Expect(',');

	peer.hosts = ParseHostList(peer.tls_name);
	Expect(']');

	if (peer.node_name.empty())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Empty peer name in response: {}",
				      GetTruncatedResponse());

	return peer;
}

int64_t
PeerParser::Parse(std::vector<Peer> &peers)
{
	const auto generation = ReadInteger();
	Expect(',');

	const auto port = ReadInteger();
	if (port < 0 || port > 0xffff)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Invalid default port in response: {}",
				      GetTruncatedResponse());
	default_port = port;
	Expect(',');
	Expect('[');

	peers.clear();

	if (SkipSymbol(']'))
		return generation;

	do {
		peers.emplace_back(ParsePeer());
	} while (SkipSymbol(','));

	Expect(']');
	return generation;
}

} // anonymous namespace

const char *
GetPeersCommand(const ClusterConfig &config) noexcept
{
	if (config.tls)
		return config.use_services_alternate
			? "peers-tls-alt"
			: "peers-tls-std";
	else
		return config.use_services_alternate
			? "peers-clear-alt"
			: "peers-clear-std";
}

int64_t
ParsePeers(std::string_view response, const ClusterConfig &config,
	   std::vector<Peer> &peers)
{
	response = Strip(response);
	if (response.empty())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "{} response is empty",
				      GetPeersCommand(config));

	PeerParser parser(config, response);
	return parser.Parse(peers);
}
