// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PipeOutputCapture.hxx"
#include "io/Logger.hxx"
#include "spawn/Prepared.hxx"
#include "system/Error.hxx"
#include "util/StringAPI.hxx"
#include "util/StringStrip.hxx"

#include <errno.h>

/**
 * The maximum number of bytes which are collected per stream.
 * Everything beyond that is only logged.
 */
static constexpr std::size_t MAX_CAPTURE = 64 * 1024;

PipeOutputCapture::Stream::Stream(EventLoop &event_loop,
				  const Logger &_logger,
				  const char *_name) noexcept
	:logger(_logger), name(_name),
	 event(event_loop, BIND_THIS_METHOD(OnSocketReady))
{
}

inline bool
PipeOutputCapture::Stream::IsStderr() const noexcept
{
	return StringIsEqual(name, "stderr");
}

UniqueFileDescriptor
PipeOutputCapture::Stream::CreatePipe()
{
	UniqueFileDescriptor w;
	if (!UniqueFileDescriptor::CreatePipe(fd, w))
		throw MakeErrno("Failed to create pipe");

	fd.SetNonBlocking();
	return w;
}

void
PipeOutputCapture::Stream::Start() noexcept
{
	event.Open(fd.Get());
	event.ScheduleRead();
}

void
PipeOutputCapture::Stream::LogLine(std::string_view line) const noexcept
{
	line = Strip(line);
	if (line.empty())
		return;

	const bool is_error = IsStderr() &&
		(line.find("error") != line.npos ||
		 line.find("ERROR") != line.npos);

	logger(is_error ? 2 : 5, name, ": ", line);
}

void
PipeOutputCapture::Stream::Feed(std::string_view data) noexcept
{
	if (collecting && text.size() < MAX_CAPTURE)
		text.append(data.substr(0, MAX_CAPTURE - text.size()));

	while (true) {
		const auto newline = data.find('\n');
		if (newline == data.npos)
			break;

		if (partial.empty()) {
			LogLine(data.substr(0, newline));
		} else {
			partial.append(data.substr(0, newline));
			LogLine(partial);
			partial.clear();
		}

		data.remove_prefix(newline + 1);
	}

	if (partial.size() < MAX_CAPTURE)
		partial.append(data);
}

void
PipeOutputCapture::Stream::Drain() noexcept
{
	if (!fd.IsDefined())
		return;

	char buffer[4096];

	while (true) {
		const ssize_t nbytes = fd.Read(buffer, sizeof(buffer));
		if (nbytes > 0) {
			Feed({buffer, std::size_t(nbytes)});
			continue;
		}

		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			if (errno == EAGAIN)
				return;

			logger(2, "Failed to read ", name, ": ",
			       MakeErrno("read() failed"));
		}

		/* end of file or error */
		event.ReleaseFd();
		fd.Close();

		if (!partial.empty()) {
			LogLine(partial);
			partial.clear();
		}

		return;
	}
}

std::string
PipeOutputCapture::Stream::Collect() noexcept
{
	Drain();

	if (!partial.empty()) {
		LogLine(partial);
		partial.clear();
	}

	return std::move(text);
}

void
PipeOutputCapture::Stream::OnSocketReady(unsigned) noexcept
{
	Drain();
}

PipeOutputCapture::PipeOutputCapture(EventLoop &event_loop,
				     const Logger &logger) noexcept
	:stdout_stream(event_loop, logger, "stdout"),
	 stderr_stream(event_loop, logger, "stderr")
{
}

void
PipeOutputCapture::Prepare(PreparedChildProcess &p)
{
	p.stdout_fd = stdout_stream.CreatePipe();
	p.stderr_fd = stderr_stream.CreatePipe();
}

void
PipeOutputCapture::Start() noexcept
{
	stdout_stream.Start();
	stderr_stream.Start();
}

void
PipeOutputCapture::Drain() noexcept
{
	stderr_stream.Drain();
	stdout_stream.Drain();
}

CapturedOutput
PipeOutputCapture::Collect() noexcept
{
	CapturedOutput result;
	result.stderr_text = stderr_stream.Collect();
	result.stdout_text = stdout_stream.Collect();
	return result;
}

void
PipeOutputCapture::Detach() noexcept
{
	stdout_stream.Detach();
	stderr_stream.Detach();
}
