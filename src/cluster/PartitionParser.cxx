// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PartitionParser.hxx"
#include "Partitions.hxx"
#include "Node.hxx"
#include "Error.hxx"
#include "Logger.hxx"
#include "util/StringUtil.hxx"

#include <sodium.h>

#include <charconv>
#include <vector>

const char *
GetReplicasCommand(const Node &node) noexcept
{
	return node.HasFeature(NodeFeature::REPLICAS)
		? "replicas"
		: "replicas-all";
}

static int64_t
ParseNumber(std::string_view s, std::string_view response)
{
	int64_t value;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Malformed number '{}' in partition response: {}",
				      s, response.substr(0, 200));

	return value;
}

/**
 * Decode a base64 bitmap.
 *
 * Throws on error.
 */
static std::vector<unsigned char>
DecodeBitmap(std::string_view ns, std::string_view b64,
	     unsigned partition_count)
{
	std::vector<unsigned char> buffer(b64.size() * 3 / 4 + 3);

	size_t length;
	if (sodium_base642bin(buffer.data(), buffer.size(),
			      b64.data(), b64.size(),
			      nullptr, &length, nullptr,
			      sodium_base64_VARIANT_ORIGINAL) != 0)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Malformed partition bitmap for namespace {}",
				      ns);

	if (length * 8 < partition_count)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Partition bitmap for namespace {} is too short",
				      ns);

	buffer.resize(length);
	return buffer;
}

namespace {

/**
 * The decoded ownership of one namespace.
 */
struct NamespaceReplicas {
	std::string_view ns;
	int regime = 0;

	/**
	 * One decoded bitmap per replica level.
	 */
	std::vector<std::vector<unsigned char>> bitmaps;
};

/**
 * Applies the response of one node to a #PartitionMapBuilder.  The
 * whole response is decoded before the builder is touched.
 */
class PartitionParser {
	Node &node;
	PartitionMapBuilder &builder;
	const Logger &logger;
	const unsigned partition_count;

	std::string_view response;

	/**
	 * Has a regime conflict been logged already?
	 */
	bool regime_error = false;

public:
	PartitionParser(Node &_node, PartitionMapBuilder &_builder,
			const Logger &_logger, unsigned _partition_count,
			std::string_view _response) noexcept
		:node(_node), builder(_builder), logger(_logger),
		 partition_count(_partition_count), response(_response) {}

	void Parse(bool with_regime);

private:
	NamespaceReplicas ParseNamespace(std::string_view entry,
					 bool with_regime) const;

	void Apply(const NamespaceReplicas &src);

	const Partitions &PrepareNamespace(std::string_view ns,
					   unsigned replica_count,
					   int regime);

	void ApplyReplica(std::string_view ns, unsigned replica,
			  const std::vector<unsigned char> &bitmap,
			  int regime);
};

void
PartitionParser::Parse(bool with_regime)
{
	std::vector<NamespaceReplicas> namespaces;

	for (const auto entry : SplitString(response, ';')) {
		const auto stripped = Strip(entry);
		if (!stripped.empty())
			namespaces.emplace_back(ParseNamespace(stripped, with_regime));
	}

	for (const auto &i : namespaces)
		Apply(i);
}

NamespaceReplicas
PartitionParser::ParseNamespace(std::string_view entry, bool with_regime) const
{
	NamespaceReplicas result;

	const auto colon = entry.find(':');
	const std::string_view ns = result.ns = Strip(entry.substr(0, colon));
	if (colon == entry.npos || ns.empty() ||
	    ns.size() > KvCluster::MAX_NAMESPACE_LENGTH)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Invalid partition namespace {}. Response={}",
				      ns, response.substr(0, 200));

	auto fields = SplitString(entry.substr(colon + 1), ',');
	std::size_t i = 0;

	if (with_regime) {
		if (fields.empty())
			throw FmtClusterError(ResultCode::PARSE_ERROR,
					      "Missing regime for namespace {}",
					      ns);

		result.regime = ParseNumber(fields[i++], response);
	}

	if (i >= fields.size())
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Missing replica count for namespace {}",
				      ns);

	const auto replica_count = ParseNumber(fields[i++], response);
	if (replica_count < 1 || replica_count > 0xff)
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Invalid replica count {} for namespace {}",
				      replica_count, ns);

	if (fields.size() - i != std::size_t(replica_count))
		throw FmtClusterError(ResultCode::PARSE_ERROR,
				      "Namespace {} has {} replica bitmaps instead of {}",
				      ns, fields.size() - i, replica_count);

	result.bitmaps.reserve(replica_count);

	for (; i < fields.size(); ++i) {
		if (fields[i].empty())
			throw FmtClusterError(ResultCode::PARSE_ERROR,
					      "Empty partition id for namespace {}",
					      ns);

		result.bitmaps.emplace_back(DecodeBitmap(ns, fields[i],
							 partition_count));
	}

	return result;
}

void
PartitionParser::Apply(const NamespaceReplicas &src)
{
	PrepareNamespace(src.ns, src.bitmaps.size(), src.regime);

	for (unsigned replica = 0; replica < src.bitmaps.size(); ++replica)
		ApplyReplica(src.ns, replica, src.bitmaps[replica], src.regime);
}

const Partitions &
PartitionParser::PrepareNamespace(std::string_view ns,
				  unsigned replica_count, int regime)
{
	const auto *partitions = builder.Find(ns);

	if (partitions == nullptr)
		return builder.Put(ns, std::make_shared<Partitions>(partition_count,
								    replica_count,
								    regime != 0));

	if (partitions->GetReplicaCount() != replica_count) {
		logger.Fmt(5, "Namespace {} replication factor changed from {} to {}",
			   ns, partitions->GetReplicaCount(), replica_count);

		return builder.Put(ns, std::make_shared<Partitions>(*partitions,
								    replica_count));
	}

	return *partitions;
}

void
PartitionParser::ApplyReplica(std::string_view ns, unsigned replica,
			      const std::vector<unsigned char> &bitmap,
			      int regime)
{
	/* copy-on-write: "edit" is obtained only when a cell
	   actually changes */
	const Partitions *partitions = builder.Find(ns);
	Partitions *edit = nullptr;

	for (unsigned i = 0; i < partition_count; ++i) {
		if ((bitmap[i >> 3] & (0x80 >> (i & 7))) == 0)
			continue;

		const int old_regime = partitions->regimes[i];
		if (regime < old_regime) {
			if (!regime_error) {
				logger.Fmt(5, "{} regime({}) < old regime({})",
					   node.ToString(), regime, old_regime);
				regime_error = true;
			}

			continue;
		}

		const auto &old = partitions->replicas[replica][i];
		if (regime == old_regime && old.get() == &node)
			continue;

		if (edit == nullptr) {
			edit = &builder.Edit(ns);
			partitions = edit;
		}

		if (regime > old_regime)
			edit->regimes[i] = regime;

		auto &cell = edit->replicas[replica][i];
		if (cell.get() != &node) {
			/* force the previous owner to re-send its
			   table */
			if (cell != nullptr)
				cell->partition_generation = -1;

			cell = node.shared_from_this();
		}
	}
}

} // anonymous namespace

void
ParsePartitions(std::string_view response, bool with_regime,
		Node &node, PartitionMapBuilder &builder,
		const Logger &logger, unsigned partition_count)
{
	PartitionParser parser(node, builder, logger, partition_count,
			       response);
	parser.Parse(with_regime);
}
