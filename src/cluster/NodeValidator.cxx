// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "NodeValidator.hxx"
#include "Config.hxx"
#include "Connection.hxx"
#include "Error.hxx"
#include "Features.hxx"
#include "Info.hxx"
#include "Logger.hxx"
#include "util/Exception.hxx"

#include <exception>

NodeValidator::NodeValidator(const ClusterConfig &_config,
			     Connector &_connector,
			     const Logger &_logger) noexcept
	:config(_config), connector(_connector), logger(_logger)
{
}

NodeValidator::~NodeValidator() noexcept = default;

std::vector<std::string>
NodeValidator::ResolveAliases(const Host &host)
{
	auto addresses = connector.Resolve(host);
	if (addresses.empty())
		throw FmtClusterError(ResultCode::SERVER_NOT_AVAILABLE,
				      "Host {} has no address", host);

	aliases.clear();
	aliases.reserve(addresses.size() + 2);
	for (const auto &i : addresses)
		aliases.emplace_back(i, host.tls_name, host.port);

	return addresses;
}

static const std::string *
FindValue(const InfoMap &map, std::string_view name) noexcept
{
	auto i = map.find(name);
	return i != map.end() && !i->second.empty() ? &i->second : nullptr;
}

void
NodeValidator::ValidateAddress(const Host &host, std::string_view address)
{
	const Host address_host(address, host.tls_name, host.port);
	auto c = connector.Connect(address_host, config.connect_timeout);

	try {
		if (config.IsAuthEnabled())
			connector.Login(*c, config);

		const bool has_cluster_name = !config.name.empty();
		const InfoMap map = has_cluster_name
			? InfoRequest(*c, {"node", "partition-generation", "features", "cluster-name"})
			: InfoRequest(*c, {"node", "partition-generation", "features"});

		const auto *node_name = FindValue(map, "node");
		if (node_name == nullptr)
			throw FmtClusterError(ResultCode::INVALID_NODE_ERROR,
					      "Host {} did not report a node name",
					      host);

		const auto *generation = FindValue(map, "partition-generation");
		if (generation == nullptr)
			throw FmtClusterError(ResultCode::INVALID_NODE_ERROR,
					      "Node {} {} did not report a partition generation",
					      *node_name, host);

		int64_t gen;
		try {
			gen = ParseInfoInteger("partition-generation", *generation);
		} catch (...) {
			std::throw_with_nested(FmtClusterError(ResultCode::INVALID_NODE_ERROR,
							       "Invalid partition-generation: {}",
							       *generation));
		}

		if (gen == -1)
			throw FmtClusterError(ResultCode::INVALID_NODE_ERROR,
					      "Node {} {} is not yet fully initialized",
					      *node_name, host);

		if (has_cluster_name) {
			const auto *id = FindValue(map, "cluster-name");
			const std::string_view received = id != nullptr
				? std::string_view{*id}
				: std::string_view{};

			if (received != config.name)
				throw FmtClusterError(ResultCode::INVALID_NODE_ERROR,
						      "Node {} {} expected cluster name '{}' received '{}'",
						      *node_name, host,
						      config.name, received);
		}

		const auto *features_value = FindValue(map, "features");

		name = *node_name;
		primary_host = host;
		primary_address = address_host;
		features = features_value != nullptr
			? ParseFeatures(*features_value)
			: 0;
	} catch (...) {
		c->Close();
		throw;
	}

	connection = std::move(c);
}

void
NodeValidator::ValidateNode(const Host &host)
{
	std::exception_ptr first_error;

	for (const auto &address : ResolveAliases(host)) {
		try {
			ValidateAddress(host, address);
			return;
		} catch (...) {
			logger.Fmt(6, "Address {} of {} failed: {}",
				   address, host,
				   GetFullMessage(std::current_exception()));

			if (!first_error)
				first_error = std::current_exception();
		}
	}

	std::rethrow_exception(first_error);
}
