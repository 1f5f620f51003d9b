// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/ScopeExit.hxx"

#include <algorithm>
#include <cassert>
#include <vector>

#include <errno.h>
#include <fnmatch.h>
#include <stdio.h>
#include <string.h>

namespace fs = boost::filesystem;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
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
VariableConfigParser::PreParseLine(FileLineParser &line)
{
	return child.PreParseLine(line);
}

void
VariableConfigParser::ParseLine(FileLineParser &line)
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

	const char *name_begin = src++;

	while (true) {
		if (src >= end)
			throw LineParser::Error("Missing '}' after variable name");

		if (!LineParser::IsWordChar(*src))
			break;

		++src;
	}

	if (*src != '}')
		throw LineParser::Error("Missing '}' after variable name");

	const std::string_view name(name_begin, src - name_begin);
	++src;

	auto i = variables.find(name);
	if (i == variables.end())
		throw LineParser::Error("No such variable: " + std::string{name});

	dest += i->second;
}

void
VariableConfigParser::ExpandQuoted(std::string &dest,
				   const char *src, const char *end) const
{
	while (true) {
		const char *dollar = (const char *)memchr(src, '$', end - src);
		if (dollar == nullptr)
			break;

		dest.append(src, dollar);

		src = dollar;
		if (src + 1 < end && src[1] == '{') {
			ExpandOne(dest, src, end);
		} else {
			dest.push_back('$');
			++src;
		}
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
			dest.push_back('\'');
			ExpandOne(dest, src, src + strlen(src));
			dest.push_back('\'');
		} else {
			dest.push_back(ch);
			++src;
		}
	}

	dest += src;
}

char *
VariableConfigParser::Expand(const char *src) const
{
	if (strstr(src, "${") == nullptr)
		return nullptr;

	buffer.clear();
	Expand(buffer, src);
	return buffer.data();
}

void
VariableConfigParser::Expand(FileLineParser &line) const
{
	char *p = Expand(line.Rest());
	if (p != nullptr)
		line.Replace(p);
}

bool
IncludeConfigParser::PreParseLine(FileLineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(FileLineParser &line)
{
	if (line.SkipWord("@include")) {
		IncludePath(line.ExpectPathAndEnd());
	} else if (line.SkipWord("@include_optional")) {
		IncludeOptionalPath(line.ExpectPathAndEnd());
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	child.Finish();
}

static void
ParseConfigFile(const fs::path &path, FILE *file, ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		FileLineParser line_parser(path, line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(path.native() + ':' + std::to_string(i)));
		}

		++i;
	}
}

/**
 * Parse an included file.  Unlike ParseConfigFile(), this does not
 * call Finish(), because that is called once for the top-level
 * file.
 */
static void
ParseIncludedFile(const fs::path &path, ConfigParser &parser)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw FmtErrno("Failed to open {}", path.native());

	AtScopeExit(file) { fclose(file); };

	ParseConfigFile(path, file, parser);
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	auto directory = p.parent_path();
	if (directory.empty())
		directory = ".";

	const auto pattern = p.filename();

	if (pattern.native().find_first_of("*?") != std::string::npos) {
		std::vector<fs::path> files;

		for (const auto &i : fs::directory_iterator(directory))
			if (fnmatch(pattern.c_str(), i.path().filename().c_str(), 0) == 0)
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
	IncludeConfigParser sub(std::move(p), child);

	FILE *file = fopen(sub.path.c_str(), "r");
	if (file == nullptr) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			throw FmtErrno(e, "Failed to open {}", sub.path.native());
		}
	}

	AtScopeExit(file) { fclose(file); };

	ParseConfigFile(sub.path, file, sub);
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw FmtErrno("Failed to open {}", path.native());

	AtScopeExit(file) { fclose(file); };

	ParseConfigFile(path, file, parser);
	parser.Finish();
}
