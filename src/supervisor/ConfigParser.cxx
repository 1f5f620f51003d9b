// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/FileLineParser.hxx"
#include "io/ConfigParser.hxx"
#include "util/StringAPI.hxx"

std::string
SupervisorConfig::GetSignature() const noexcept
{
	if (!signature.empty())
		return signature;

	return boost::filesystem::path(executable).filename().string();
}

class SupervisorConfigParser final : public ConfigParser {
	SupervisorConfig &config;

public:
	explicit SupervisorConfigParser(SupervisorConfig &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void ParseCapture(FileLineParser &line);
};

inline void
SupervisorConfigParser::ParseCapture(FileLineParser &line)
{
	const char *value = line.ExpectValueAndEnd();

	if (StringIsEqual(value, "pipe"))
		config.capture = CaptureMode::PIPE;
	else if (StringIsEqual(value, "file"))
		config.capture = CaptureMode::FILE;
	else
		throw LineParser::Error("\"pipe\" or \"file\" expected");
}

void
SupervisorConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "enabled")) {
		config.enabled = line.NextBool();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "executable")) {
		config.executable = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "argument")) {
		config.arguments.emplace_back(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "signature")) {
		config.signature = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "capture")) {
		ParseCapture(line);
	} else if (StringIsEqual(word, "max_retries")) {
		config.max_retries = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "startup_checks")) {
		config.startup_checks = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "startup_delay_ms")) {
		config.startup_delay = line.NextMilliseconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "stop_grace_ms")) {
		config.stop_grace = line.NextMilliseconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "kill_wait_ms")) {
		config.kill_wait = line.NextMilliseconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "port_release_ms")) {
		config.port_release = line.NextMilliseconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "zombie_grace_ms")) {
		config.zombie_grace = line.NextMilliseconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "retry_cooldown_ms")) {
		config.retry_cooldown = line.NextMilliseconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "command_timeout_ms")) {
		config.command_timeout = line.NextMilliseconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "verbose")) {
		config.verbose = line.NextUnsigned();
		line.ExpectEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
SupervisorConfigParser::Finish()
{
	if (config.executable.empty())
		throw LineParser::Error("No executable configured");

	if (config.command_timeout.count() == 0)
		throw LineParser::Error("command_timeout_ms must not be zero");

	ConfigParser::Finish();
}

void
LoadSupervisorConfig(SupervisorConfig &config,
		     const boost::filesystem::path &path)
{
	SupervisorConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(boost::filesystem::path(path), parser2);

	ParseConfigFile(path, parser3);
}
