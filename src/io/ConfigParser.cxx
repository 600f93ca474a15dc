// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "system/Error.hxx"

#include <algorithm>
#include <vector>

#include <assert.h>
#include <fnmatch.h>
#include <stdio.h>
#include <string.h>

namespace fs = boost::filesystem;

namespace {

class FileCloser {
	FILE *const file;

public:
	explicit FileCloser(FILE *_file) noexcept:file(_file) {}

	~FileCloser() noexcept {
		fclose(file);
	}

	FileCloser(const FileCloser &) = delete;
	FileCloser &operator=(const FileCloser &) = delete;
};

} // anonymous namespace

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
NestedConfigParser::PreParseLine(LineParser &line)
{
	if (child) {
		if (child->PreParseLine(line))
			return true;

		if (line.SkipSymbol('}')) {
			line.ExpectEnd();
			child->Finish();
			child.reset();
			return true;
		}
	}

	return ConfigParser::PreParseLine(line);
}

void
NestedConfigParser::ParseLine(LineParser &line)
{
	if (child)
		child->ParseLine(line);
	else
		ParseLine2(line);
}

void
NestedConfigParser::Finish()
{
	if (child)
		throw LineParser::Error("Block not closed at end of file");

	ConfigParser::Finish();
}

void
NestedConfigParser::SetChild(std::unique_ptr<ConfigParser> &&_child) noexcept
{
	assert(!child);

	child = std::move(_child);
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

bool
VariableConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line);
}

void
VariableConfigParser::ParseLine(LineParser &line)
{
	Expand(line);

	if (line.SkipWord("@set")) {
		const char *name = line.ExpectWordAndSymbol('=',
							    "Variable name expected",
							    "'=' expected");
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected after '='");

		line.ExpectEnd();

		variables.insert_or_assign(name, value);
	} else {
		child.ParseLine(line);
	}
}

void
VariableConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
VariableConfigParser::ExpandOne(std::string &dest,
				const char *&src, const char *end) const
{
	assert(src + 2 <= end);
	assert(*src == '$');
	assert(src[1] == '{');

	src += 2;

	if (src >= end || !LineParser::IsWordChar(*src))
		throw LineParser::Error("Variable name expected after '${'");

	const char *name_begin = src;

	do {
		if (++src >= end)
			throw LineParser::Error("Missing '}' after variable name");
	} while (LineParser::IsWordChar(*src));

	if (*src != '}')
		throw LineParser::Error("Missing '}' after variable name");

	const std::string_view name(name_begin, src - name_begin);
	++src;

	auto i = variables.find(name);
	if (i == variables.end())
		throw FmtRuntimeError("No such variable: {}", name);

	dest += i->second;
}

void
VariableConfigParser::ExpandQuoted(std::string &dest,
				   const char *src, const char *end) const
{
	while (true) {
		const char *dollar = (const char *)memchr(src, '$', end - src);
		if (dollar == nullptr || dollar + 1 >= end || dollar[1] != '{')
			break;

		dest.append(src, dollar);

		src = dollar;
		ExpandOne(dest, src, end);
	}

	dest.append(src, end);
}

void
VariableConfigParser::Expand(std::string &dest, const char *src) const
{
	while (true) {
		const char ch = *src;
		if (ch == 0)
			break;

		if (ch == '\'') {
			const char *end = strchr(src + 1, '\'');
			if (end == nullptr)
				break;

			++end;
			dest.append(src, end);
			src = end;
		} else if (ch == '"') {
			const char *end = strchr(src + 1, '"');
			if (end == nullptr)
				break;

			dest.push_back(ch);
			ExpandQuoted(dest, src + 1, end);
			dest.push_back(ch);
			src = end + 1;
		} else if (ch == '$' && src[1] == '{') {
			dest.push_back('"');
			ExpandOne(dest, src, src + strlen(src));
			dest.push_back('"');
		} else {
			dest.push_back(ch);
			++src;
		}
	}

	dest += src;
}

void
VariableConfigParser::Expand(LineParser &line)
{
	const char *src = line.Rest();
	if (strstr(src, "${") == nullptr)
		return;

	std::string expanded;
	Expand(expanded, src);
	buffer = std::move(expanded);
	line.Replace(buffer.data());
}

bool
IncludeConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(LineParser &line)
{
	if (line.SkipWord("@include")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludePath(p);
	} else if (line.SkipWord("@include_optional")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludeOptionalPath(p);
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	child.Finish();
}

static fs::path
ApplyPath(const fs::path &base, fs::path &&p)
{
	if (p.is_absolute())
		/* is already absolute */
		return std::move(p);

	return base.parent_path() / p;
}

static void
ParseConfigFile(const fs::path &path, FILE *file, ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("{}:{}",
							       path.native(), i));
		}

		++i;
	}
}

/**
 * Parse an included file without calling Finish() on the shared
 * child parser.
 */
static void
ParseIncludedFile(const fs::path &path, ConfigParser &parser)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw FmtRuntimeError("Failed to open {}: {}",
				      path.native(), strerror(errno));

	FileCloser closer(file);
	ParseConfigFile(path, file, parser);
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	p = ApplyPath(path, std::move(p));

	auto directory = p.parent_path();
	if (directory.empty())
		directory = ".";

	const auto pattern = p.filename();

	if (pattern.native().find_first_of("*?") != std::string::npos) {
		std::vector<fs::path> files;

		for (const auto &i : fs::directory_iterator(directory))
			if (fnmatch(pattern.c_str(),
				    i.path().filename().c_str(), 0) == 0)
				files.emplace_back(i.path());

		std::sort(files.begin(), files.end());

		for (auto &i : files) {
			IncludeConfigParser sub(std::move(i), child);
			ParseIncludedFile(sub.path, sub);
		}
	} else {
		IncludeConfigParser sub(std::move(p), child);
		ParseIncludedFile(sub.path, sub);
	}
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	IncludeConfigParser sub(ApplyPath(path, std::move(p)), child);

	FILE *file = fopen(sub.path.c_str(), "r");
	if (file == nullptr) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			throw MakeErrno(e, ("Failed to open " + sub.path.native()).c_str());
		}
	}

	FileCloser closer(file);
	ParseConfigFile(sub.path, file, sub);
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw MakeErrno(("Failed to open " + path.native()).c_str());

	FileCloser closer(file);
	ParseConfigFile(path, file, parser);
	parser.Finish();
}
