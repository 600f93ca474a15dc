// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Info.hxx"
#include "Connection.hxx"
#include "Error.hxx"
#include "util/StringUtil.hxx"

#include <charconv>

using namespace KvCluster;

std::string
MakeInfoRequest(std::span<const std::string_view> commands) noexcept
{
	std::string body;
	for (const auto i : commands) {
		body.append(i);
		body.push_back('\n');
	}

	return body;
}

std::string
MakeInfoRequest(std::initializer_list<std::string_view> commands) noexcept
{
	return MakeInfoRequest(std::span{commands.begin(), commands.size()});
}

std::string
EncodeInfoMessage(std::string_view body) noexcept
{
	InfoHeader header;
	header.version = INFO_PROTOCOL_VERSION;
	header.type = INFO_MESSAGE_TYPE;

	uint64_t length = body.size();
	for (int i = 5; i >= 0; --i) {
		header.length[i] = uint8_t(length);
		length >>= 8;
	}

	std::string result;
	result.reserve(sizeof(header) + body.size());
	result.append((const char *)&header, sizeof(header));
	result.append(body);
	return result;
}

uint64_t
DecodeInfoHeader(const InfoHeader &header)
{
	if (header.version != INFO_PROTOCOL_VERSION)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Unsupported info protocol version {}",
				      header.version);

	if (header.type != INFO_MESSAGE_TYPE)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Unexpected message type {}",
				      header.type);

	uint64_t length = 0;
	for (const auto i : header.length)
		length = (length << 8) | i;

	if (length > MAX_INFO_BODY)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Info response too large: {} bytes",
				      length);

	return length;
}

InfoMap
ParseInfoResponse(std::string_view body) noexcept
{
	InfoMap map;

	for (const auto line : SplitString(body, '\n')) {
		if (line.empty())
			continue;

		const auto tab = line.find('\t');
		if (tab == line.npos)
			map.insert_or_assign(std::string{line}, std::string{});
		else
			map.insert_or_assign(std::string{line.substr(0, tab)},
					     std::string{line.substr(tab + 1)});
	}

	return map;
}

InfoMap
InfoRequest(Connection &connection,
	    std::span<const std::string_view> commands)
{
	auto map = ParseInfoResponse(connection.Info(MakeInfoRequest(commands)));
	connection.UpdateLastUsed();
	return map;
}

InfoMap
InfoRequest(Connection &connection,
	    std::initializer_list<std::string_view> commands)
{
	return InfoRequest(connection,
			   std::span{commands.begin(), commands.size()});
}

std::string
InfoRequest(Connection &connection, std::string_view command)
{
	const std::initializer_list<std::string_view> commands{command};
	auto map = InfoRequest(connection, commands);
	auto i = map.find(command);
	if (i == map.end())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "{} response is missing", command);

	return std::move(i->second);
}

const std::string &
GetInfoValue(const InfoMap &map, std::string_view name)
{
	auto i = map.find(name);
	if (i == map.end() || i->second.empty())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "{} is empty", name);

	return i->second;
}

int64_t
ParseInfoInteger(std::string_view name, std::string_view value)
{
	value = Strip(value);

	int64_t result;
	auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
					 result);
	if (value.empty() || ec != std::errc{} ||
	    ptr != value.data() + value.size())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Invalid {}: '{}'", name, value);

	return result;
}
