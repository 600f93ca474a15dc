// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ConfigParser.hxx"
#include "Config.hxx"
#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "util/StringUtil.hxx"

#include <exception>
#include <memory>
#include <string>
#include <string_view>

class ClusterConfigParser final : public NestedConfigParser {
	ClusterConfig &config;

	bool found = false;

	class Block final : public ConfigParser {
		ClusterConfigParser &parent;

		/**
		 * The seeds listed in this block; they replace the
		 * previously configured seeds in Finish().
		 */
		std::vector<Host> seeds;

		/**
		 * The "rack_id" lines of this block, in order of
		 * preference.
		 */
		std::vector<unsigned> rack_ids;

	public:
		explicit Block(ClusterConfigParser &_parent) noexcept
			:parent(_parent) {}

	protected:
		/* virtual methods from class ConfigParser */
		void ParseLine(LineParser &line) override;
		void Finish() override;
	};

public:
	explicit ClusterConfigParser(ClusterConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void Finish() override;

protected:
	/* virtual methods from class NestedConfigParser */
	void ParseLine2(LineParser &line) override;

private:
	void CreateCluster(LineParser &line);
};

void
ClusterConfigParser::Block::ParseLine(LineParser &line)
{
	auto &config = parent.config;

	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "seed")) {
		const char *value = line.ExpectValueAndEnd();
		for (auto &i : ParseHosts(value, DEFAULT_NODE_PORT))
			seeds.emplace_back(std::move(i));
	} else if (StringIsEqual(word, "user")) {
		config.user = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "password")) {
		config.password = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "tls")) {
		config.tls = line.NextBool();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "rack_id")) {
		rack_ids.push_back(line.NextPositiveInteger());
		line.ExpectEnd();
	} else if (StringIsEqual(word, "ip_map")) {
		std::string from = line.ExpectValue();
		std::string to = line.ExpectValueAndEnd();

		if (!config.ip_map.emplace(std::move(from), std::move(to)).second)
			throw LineParser::Error("Duplicate ip_map entry");
	} else {
		const char *value = line.ExpectValueAndEnd();

		try {
			config.HandleSet(word, value);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(std::string{"Bad value for '"} + word + "'"));
		}
	}
}

void
ClusterConfigParser::Block::Finish()
{
	auto &config = parent.config;

	if (!seeds.empty())
		config.seeds = std::move(seeds);

	if (!rack_ids.empty())
		config.rack_ids = std::move(rack_ids);

	if (config.seeds.empty())
		throw LineParser::Error("No seed configured");

	ConfigParser::Finish();
}

inline void
ClusterConfigParser::CreateCluster(LineParser &line)
{
	if (found)
		throw LineParser::Error("Duplicate cluster block");

	found = true;

	if (line.front() != '{')
		config.name = line.ExpectValue();

	line.ExpectSymbolAndEol('{');

	SetChild(std::make_unique<Block>(*this));
}

void
ClusterConfigParser::ParseLine2(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "cluster"))
		CreateCluster(line);
	else
		throw LineParser::Error("Unknown option");
}

void
ClusterConfigParser::Finish()
{
	if (!found)
		throw LineParser::Error("No cluster block");

	NestedConfigParser::Finish();
}

void
LoadConfigFile(ClusterConfig &config, const boost::filesystem::path &path)
{
	ClusterConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(boost::filesystem::path{path}, parser2);

	ParseConfigFile(path, parser3);
}
