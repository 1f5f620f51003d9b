// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "OutputCapture.hxx"

/**
 * An #OutputCapture implementation which redirects the output to
 * temporary files.  Nothing is inspected while the process is
 * starting; the files are read by Collect() and deleted afterwards.
 */
class FileOutputCapture final : public OutputCapture {
	const Logger &logger;

	/**
	 * A file name fragment derived from the tag.
	 */
	const std::string tag;

	std::string stdout_path, stderr_path;

public:
	FileOutputCapture(const Logger &_logger, std::string_view _tag) noexcept;

	/**
	 * Deletes the files if that hasn't happened yet.
	 */
	~FileOutputCapture() noexcept override;

	FileOutputCapture(const FileOutputCapture &) = delete;
	FileOutputCapture &operator=(const FileOutputCapture &) = delete;

	/* virtual methods from class OutputCapture */
	void Prepare(PreparedChildProcess &p) override;
	void Start() noexcept override {}
	void Drain() noexcept override {}
	CapturedOutput Collect() noexcept override;
	void Detach() noexcept override;

private:
	std::string Load(const std::string &path) const noexcept;
	void Unlink(std::string &path) const noexcept;
};
