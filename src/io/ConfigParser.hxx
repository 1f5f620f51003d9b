// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem.hpp>

#include <map>
#include <string>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine(FileLineParser &line);

	virtual void ParseLine(FileLineParser &line) = 0;

	/**
	 * Called after the last line has been parsed.  May throw if
	 * the configuration is incomplete.
	 */
	virtual void Finish() {}
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
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can define and use variables.
 */
class VariableConfigParser final : public ConfigParser {
	ConfigParser &child;

	std::map<std::string, std::string, std::less<>> variables;

	mutable std::string buffer;

public:
	explicit VariableConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void ExpandOne(std::string &dest,
		       const char *&src, const char *end) const;
	void ExpandQuoted(std::string &dest,
			  const char *src, const char *end) const;
	void Expand(std::string &dest, const char *src) const;
	char *Expand(const char *src) const;
	void Expand(FileLineParser &line) const;
};

/**
 * A #ConfigParser which can "include" other files.
 */
class IncludeConfigParser final : public ConfigParser {
	const boost::filesystem::path path;

	ConfigParser &child;

public:
	IncludeConfigParser(boost::filesystem::path &&_path,
			    ConfigParser &_child) noexcept
		:path(std::move(_path)), child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void IncludePath(boost::filesystem::path &&p);
	void IncludeOptionalPath(boost::filesystem::path &&p);
};

/**
 * Parse a configuration file, feeding each line into the given
 * #ConfigParser and calling its Finish() method at the end.
 *
 * Throws on error; the exception is nested inside a
 * #LineParser::Error which names the file and the line number.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);
