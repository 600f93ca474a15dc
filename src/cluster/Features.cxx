// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Features.hxx"
#include "util/StringUtil.hxx"

using std::string_view_literals::operator""sv;

static unsigned
ParseFeature(std::string_view name) noexcept
{
	if (name == "geo"sv)
		return unsigned(NodeFeature::GEO);
	else if (name == "float"sv)
		return unsigned(NodeFeature::DOUBLE);
	else if (name == "batch-index"sv)
		return unsigned(NodeFeature::BATCH_INDEX);
	else if (name == "replicas"sv)
		return unsigned(NodeFeature::REPLICAS);
	else if (name == "replicas-all"sv)
		return unsigned(NodeFeature::REPLICAS_ALL);
	else if (name == "peers"sv)
		return unsigned(NodeFeature::PEERS);
	else if (name == "pquery"sv)
		return unsigned(NodeFeature::PARTITION_QUERY);
	else if (name == "pscans"sv)
		return unsigned(NodeFeature::PARTITION_SCAN);
	else
		return 0;
}

unsigned
ParseFeatures(std::string_view s) noexcept
{
	unsigned result = 0;
	for (const auto i : SplitString(s, ';'))
		result |= ParseFeature(Strip(i));
	return result;
}
