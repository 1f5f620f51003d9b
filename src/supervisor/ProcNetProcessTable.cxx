// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProcNetProcessTable.hxx"
#include "io/StringFile.hxx"
#include "system/Error.hxx"
#include "util/StringStrip.hxx"

#include <boost/filesystem.hpp>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace fs = boost::filesystem;

/**
 * Parse a /proc directory entry name as a process id.
 */
[[gnu::pure]]
static pid_t
ParsePidName(const std::string &name) noexcept
{
	pid_t pid;
	const auto [ptr, ec] = std::from_chars(name.data(),
					       name.data() + name.size(), pid);
	if (ec != std::errc{} || ptr != name.data() + name.size() || pid <= 0)
		return -1;

	return pid;
}

/**
 * Invoke the given function for each process id in /proc.
 */
template<typename F>
static void
ForEachProcess(F &&f)
{
	boost::system::error_code ec;
	for (fs::directory_iterator i("/proc", ec), end; !ec && i != end;
	     i.increment(ec)) {
		const pid_t pid = ParsePidName(i->path().filename().string());
		if (pid > 0)
			f(pid, i->path());
	}

	if (ec)
		throw std::system_error(ec.value(), std::system_category(),
					"Failed to list /proc");
}

/**
 * Does the process have a file descriptor referring to one of the
 * given socket inodes?  Processes which disappear or which we may
 * not inspect are ignored.
 */
static bool
HasSocketInode(const fs::path &process_path,
	       const std::vector<unsigned long> &inodes) noexcept
{
	boost::system::error_code ec;
	for (fs::directory_iterator i(process_path / "fd", ec), end;
	     !ec && i != end; i.increment(ec)) {
		boost::system::error_code ec2;
		const auto target = fs::read_symlink(i->path(), ec2);
		if (ec2)
			continue;

		const auto inode = ParseSocketLink(target.string());
		if (inode && std::find(inodes.begin(), inodes.end(),
				       *inode) != inodes.end())
			return true;
	}

	return false;
}

std::vector<pid_t>
ProcNetProcessTable::FindListeners(unsigned port) const
{
	std::vector<unsigned long> inodes;

	for (const char *path : {"/proc/net/tcp", "/proc/net/tcp6"}) {
		std::string contents;
		try {
			contents = LoadStringFile(path);
		} catch (const std::system_error &e) {
			if (IsFileNotFound(e))
				/* no IPv6 support */
				continue;
			throw;
		}

		const auto found = ParseProcNetTcp(contents, port);
		inodes.insert(inodes.end(), found.begin(), found.end());
	}

	std::vector<pid_t> result;
	if (inodes.empty())
		return result;

	ForEachProcess([&](pid_t pid, const fs::path &process_path){
		if (HasSocketInode(process_path, inodes))
			result.push_back(pid);
	});

	return result;
}

/**
 * Load /proc/PID/cmdline and replace the null separators with
 * spaces.  Returns an empty string if the process has disappeared
 * or is a kernel thread.
 */
static std::string
LoadCommandLine(const fs::path &process_path) noexcept
{
	std::string command;

	try {
		command = LoadStringFile((process_path / "cmdline").c_str());
	} catch (const std::system_error &) {
		/* the process has just exited */
		return {};
	}

	std::replace(command.begin(), command.end(), '\0', ' ');
	return std::string{Strip(std::string_view{command})};
}

std::vector<ProcessInfo>
ProcNetProcessTable::ListProcesses() const
{
	std::vector<ProcessInfo> result;

	ForEachProcess([&](pid_t pid, const fs::path &process_path){
		auto command = LoadCommandLine(process_path);
		if (!command.empty())
			result.push_back({pid, std::move(command)});
	});

	return result;
}
