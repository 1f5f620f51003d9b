// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileOutputCapture.hxx"
#include "io/Logger.hxx"
#include "io/StringFile.hxx"
#include "spawn/Prepared.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/CharUtil.hxx"

#include <fmt/format.h>

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

/**
 * Replace all characters which are not safe in a file name.
 */
static std::string
SanitizeTag(std::string_view tag) noexcept
{
	std::string result{tag};
	for (auto &ch : result)
		if (!IsAlphaNumericASCII(ch) && ch != '-' && ch != '_')
			ch = '_';
	return result;
}

[[gnu::pure]]
static const char *
GetTemporaryDirectory() noexcept
{
	const char *dir = getenv("TMPDIR");
	if (dir == nullptr || *dir == 0)
		dir = "/tmp";
	return dir;
}

/**
 * Create a new temporary file with O_CLOEXEC.
 *
 * Throws on error.
 *
 * @param path receives the path of the new file
 */
static UniqueFileDescriptor
CreateTemporaryFile(std::string &path, std::string_view tag,
		    const char *stream)
{
	static constexpr int SUFFIX_LENGTH = 4; // ".log"

	std::string buffer = fmt::format("{}/sidecar_{}_{}_XXXXXX.log",
					 GetTemporaryDirectory(),
					 tag, stream);

	const int fd = mkostemps(buffer.data(), SUFFIX_LENGTH, O_CLOEXEC);
	if (fd < 0)
		throw FmtErrno("Failed to create temporary file {}", buffer);

	path = std::move(buffer);
	return UniqueFileDescriptor{fd};
}

FileOutputCapture::FileOutputCapture(const Logger &_logger,
				     std::string_view _tag) noexcept
	:logger(_logger), tag(SanitizeTag(_tag))
{
}

FileOutputCapture::~FileOutputCapture() noexcept
{
	Unlink(stdout_path);
	Unlink(stderr_path);
}

void
FileOutputCapture::Unlink(std::string &path) const noexcept
{
	if (path.empty())
		return;

	if (unlink(path.c_str()) < 0 && errno != ENOENT)
		logger(3, "Failed to delete ", path, ": ",
		       MakeErrno("unlink() failed"));

	path.clear();
}

void
FileOutputCapture::Prepare(PreparedChildProcess &p)
{
	p.stdout_fd = CreateTemporaryFile(stdout_path, tag, "stdout");
	p.stderr_fd = CreateTemporaryFile(stderr_path, tag, "stderr");

	logger(5, "Using temporary files for sidecar output: stdout=",
	       stdout_path, ", stderr=", stderr_path);
}

std::string
FileOutputCapture::Load(const std::string &path) const noexcept
{
	if (path.empty())
		return {};

	try {
		return LoadStringFile(path.c_str());
	} catch (const std::exception &e) {
		logger(3, "Failed to read ", path, ": ", e);
		return {};
	}
}

CapturedOutput
FileOutputCapture::Collect() noexcept
{
	CapturedOutput result;
	result.stdout_text = Load(stdout_path);
	result.stderr_text = Load(stderr_path);

	Unlink(stdout_path);
	Unlink(stderr_path);

	return result;
}

void
FileOutputCapture::Detach() noexcept
{
	Unlink(stdout_path);
	Unlink(stderr_path);
}
