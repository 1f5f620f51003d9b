// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "spawn/RunCommand.hxx"

#include <gtest/gtest.h>

#include <sys/wait.h>

using namespace std::chrono_literals;

TEST(RunCommand, Output)
{
	const auto result = RunCommand({"/bin/sh", "-c", "echo hello; echo world >&2"}, 5s);
	EXPECT_TRUE(result.IsSuccess());
	EXPECT_EQ(result.output, "hello\n");
}

TEST(RunCommand, ExitStatus)
{
	const auto result = RunCommand({"/bin/sh", "-c", "exit 3"}, 5s);
	EXPECT_FALSE(result.IsSuccess());
	ASSERT_TRUE(WIFEXITED(result.status));
	EXPECT_EQ(WEXITSTATUS(result.status), 3);
}

TEST(RunCommand, NoSuchExecutable)
{
	const auto result = RunCommand({"/nonexistent/command"}, 5s);
	EXPECT_FALSE(result.IsSuccess());
}

TEST(RunCommand, Timeout)
{
	EXPECT_ANY_THROW(RunCommand({"/bin/sleep", "10"}, 200ms));
}
