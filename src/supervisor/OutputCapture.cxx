// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "OutputCapture.hxx"
#include "PipeOutputCapture.hxx"
#include "FileOutputCapture.hxx"
#include "Config.hxx"

std::unique_ptr<OutputCapture>
CreateOutputCapture(CaptureMode mode, EventLoop &event_loop,
		    const Logger &logger, std::string_view tag)
{
	switch (mode) {
	case CaptureMode::PIPE:
		break;

	case CaptureMode::FILE:
		return std::make_unique<FileOutputCapture>(logger, tag);
	}

	return std::make_unique<PipeOutputCapture>(event_loop, logger);
}
