// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "RackParser.hxx"
#include "Error.hxx"
#include "util/StringUtil.hxx"

#include <kvcluster/Protocol.hxx>

#include <charconv>

static unsigned
ParseRackId(std::string_view s, std::string_view value)
{
	s = Strip(s);

	unsigned result;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       result);
	if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Invalid rack id {}. Response={}",
				      s, value.substr(0, 200));

	return result;
}

RackMap
ParseRacks(std::string_view value)
{
	RackMap racks;

	for (const auto entry : SplitString(value, ';')) {
		if (Strip(entry).empty())
			continue;

		const auto colon = entry.find(':');
		const auto ns = Strip(entry.substr(0, colon));
		if (colon == entry.npos || ns.empty() ||
		    ns.size() > KvCluster::MAX_NAMESPACE_LENGTH)
			throw FmtClusterError(ResultCode::PARSE_ERROR,
					      "Invalid rack namespace {}. Response={}",
					      ns, value.substr(0, 200));

		racks.insert_or_assign(std::string{ns},
				       ParseRackId(entry.substr(colon + 1), value));
	}

	return racks;
}
