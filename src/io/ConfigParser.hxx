// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <boost/filesystem.hpp>

#include <map>
#include <memory>
#include <string>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which can dynamically forward method calls to a
 * nested #ConfigParser instance.
 */
class NestedConfigParser : public ConfigParser {
	std::unique_ptr<ConfigParser> child;

public:
	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) final;
	void Finish() override;

protected:
	void SetChild(std::unique_ptr<ConfigParser> &&_child) noexcept;
	virtual void ParseLine2(LineParser &line) = 0;
};

/**
 * A #ConfigParser which ignores lines starting with '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can define and expand variables with
 * "@set NAME=VALUE" and "${NAME}".
 */
class VariableConfigParser final : public ConfigParser {
	ConfigParser &child;

	std::map<std::string, std::string, std::less<>> variables;

	std::string buffer;

public:
	explicit VariableConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;

private:
	void ExpandOne(std::string &dest,
		       const char *&src, const char *end) const;
	void ExpandQuoted(std::string &dest,
			  const char *src, const char *end) const;
	void Expand(std::string &dest, const char *src) const;
	void Expand(LineParser &line);
};

/**
 * A #ConfigParser which handles "@include" and "@include_optional".
 */
class IncludeConfigParser final : public ConfigParser {
	const boost::filesystem::path path;

	ConfigParser &child;

public:
	IncludeConfigParser(boost::filesystem::path &&_path,
			    ConfigParser &_child) noexcept
		:path(std::move(_path)), child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;

private:
	void IncludePath(boost::filesystem::path &&p);
	void IncludeOptionalPath(boost::filesystem::path &&p);
};

void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);
