// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProcessTable.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#ifdef __linux__
#include "ProcNetProcessTable.hxx"
#else
#include "LsofProcessTable.hxx"
#endif

#include <charconv>

std::unique_ptr<ProcessTable>
CreateProcessTable([[maybe_unused]] std::chrono::milliseconds command_timeout)
{
#ifdef __linux__
	return std::make_unique<ProcNetProcessTable>();
#else
	return std::make_unique<LsofProcessTable>(command_timeout);
#endif
}

/**
 * Split the next whitespace-separated token off the given string.
 */
static std::string_view
NextToken(std::string_view &s) noexcept
{
	s = StripLeft(s);

	std::size_t i = 0;
	while (i < s.size() && !IsWhitespaceOrNull(s[i]))
		++i;

	const auto token = s.substr(0, i);
	s.remove_prefix(i);
	return token;
}

/**
 * Split the next line off the given string.
 */
static std::string_view
NextLine(std::string_view &s) noexcept
{
	const auto newline = s.find('\n');
	if (newline == s.npos) {
		const auto line = s;
		s = {};
		return line;
	}

	const auto line = s.substr(0, newline);
	s.remove_prefix(newline + 1);
	return line;
}

template<typename T>
static bool
ParseWhole(std::string_view s, T &value, int base=10) noexcept
{
	if (s.empty())
		return false;

	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value, base);
	return ec == std::errc{} && ptr == s.data() + s.size();
}

/**
 * The "st" column value of a listening socket.
 */
static constexpr std::string_view TCP_LISTEN = "0A";

std::vector<unsigned long>
ParseProcNetTcp(std::string_view contents, unsigned port) noexcept
{
	std::vector<unsigned long> result;

	/* skip the header line */
	NextLine(contents);

	while (!contents.empty()) {
		auto line = NextLine(contents);

		NextToken(line); // "sl"
		const auto local = NextToken(line);
		NextToken(line); // "rem_address"
		const auto state = NextToken(line);

		if (state != TCP_LISTEN)
			continue;

		const auto colon = local.rfind(':');
		unsigned local_port;
		if (colon == local.npos ||
		    !ParseWhole(local.substr(colon + 1), local_port, 16) ||
		    local_port != port)
			continue;

		/* skip "tx_queue:rx_queue", "tr:tm->when", "retrnsmt",
		   "uid", "timeout" */
		for (unsigned i = 0; i < 5; ++i)
			NextToken(line);

		unsigned long inode;
		if (ParseWhole(NextToken(line), inode) && inode != 0)
			result.push_back(inode);
	}

	return result;
}

std::optional<unsigned long>
ParseSocketLink(std::string_view link) noexcept
{
	static constexpr std::string_view prefix = "socket:[";

	if (!link.starts_with(prefix) || !link.ends_with(']'))
		return std::nullopt;

	link.remove_prefix(prefix.size());
	link.remove_suffix(1);

	unsigned long inode;
	if (!ParseWhole(link, inode))
		return std::nullopt;

	return inode;
}

std::vector<pid_t>
ParseLsofOutput(std::string_view output) noexcept
{
	std::vector<pid_t> result;

	while (!output.empty()) {
		const auto line = Strip(NextLine(output));

		pid_t pid;
		if (ParseWhole(line, pid) && pid > 0)
			result.push_back(pid);
	}

	return result;
}

std::vector<ProcessInfo>
ParsePsOutput(std::string_view output) noexcept
{
	std::vector<ProcessInfo> result;

	while (!output.empty()) {
		auto line = NextLine(output);

		pid_t pid;
		if (!ParseWhole(NextToken(line), pid) || pid <= 0)
			continue;

		const auto command = Strip(line);
		if (command.empty())
			continue;

		result.push_back({pid, std::string{command}});
	}

	return result;
}

/**
 * Does the string start with the given port number, followed by
 * the end of the string or whitespace?
 */
[[gnu::pure]]
static bool
StartsWithPort(std::string_view s, std::string_view port) noexcept
{
	if (!s.starts_with(port))
		return false;

	s.remove_prefix(port.size());
	return s.empty() || IsWhitespaceNotNull(s.front());
}

bool
MatchesLaunchSignature(std::string_view command,
		       std::string_view signature,
		       unsigned port) noexcept
{
	if (signature.empty() || command.find(signature) == command.npos)
		return false;

	static constexpr std::string_view option = "--port";
	const auto port_string = std::to_string(port);

	for (auto i = command.find(option); i != command.npos;
	     i = command.find(option, i + 1)) {
		auto rest = command.substr(i + option.size());
		if (rest.empty())
			break;

		if (rest.front() == '=' || rest.front() == ' ') {
			rest.remove_prefix(1);
			if (StartsWithPort(rest, port_string))
				return true;
		}
	}

	return false;
}
