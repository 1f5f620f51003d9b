// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "supervisor/Config.hxx"
#include "io/LineParser.hxx"
#include "system/Error.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include <stdlib.h>
#include <unistd.h>

/**
 * A temporary file which is deleted by the destructor.
 */
class TemporaryConfigFile {
	std::string path;

public:
	explicit TemporaryConfigFile(std::string_view contents) {
		char buffer[] = "/tmp/sidecar_test_XXXXXX.conf";
		int fd = mkstemps(buffer, 5);
		if (fd < 0)
			throw MakeErrno("mkstemps() failed");

		path = buffer;

		ssize_t nbytes = write(fd, contents.data(), contents.size());
		close(fd);

		if (nbytes != ssize_t(contents.size()))
			throw std::runtime_error("Short write");
	}

	~TemporaryConfigFile() noexcept {
		unlink(path.c_str());
	}

	TemporaryConfigFile(const TemporaryConfigFile &) = delete;
	TemporaryConfigFile &operator=(const TemporaryConfigFile &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}
};

static SupervisorConfig
Load(std::string_view contents)
{
	const TemporaryConfigFile file{contents};

	SupervisorConfig config;
	LoadSupervisorConfig(config, file.GetPath());
	return config;
}

TEST(SupervisorConfig, Defaults)
{
	const SupervisorConfig config;
	EXPECT_TRUE(config.enabled);
	EXPECT_EQ(config.capture, CaptureMode::PIPE);
	EXPECT_EQ(config.max_retries, 3u);
	EXPECT_EQ(config.startup_checks, 40u);
	EXPECT_EQ(config.startup_delay, std::chrono::seconds(2));
	EXPECT_EQ(config.zombie_grace, std::chrono::seconds(3));
}

TEST(SupervisorConfig, Signature)
{
	SupervisorConfig config;
	config.executable = "/opt/sidecar/bin/sidecar-server";
	EXPECT_EQ(config.GetSignature(), "sidecar-server");

	config.signature = "sidecar-server serve";
	EXPECT_EQ(config.GetSignature(), "sidecar-server serve");
}

TEST(SupervisorConfig, Parse)
{
	const auto config = Load(R"(# a comment
enabled no
executable /usr/local/bin/sidecar
argument serve
argument "--log-level=debug"
signature "sidecar serve"

capture file
max_retries 5
startup_checks 10
startup_delay_ms 250
stop_grace_ms 1000
kill_wait_ms 500
port_release_ms 100
zombie_grace_ms 200
retry_cooldown_ms 300
command_timeout_ms 4000
verbose 5
)");

	EXPECT_FALSE(config.enabled);
	EXPECT_EQ(config.executable, "/usr/local/bin/sidecar");
	ASSERT_EQ(config.arguments.size(), 2u);
	EXPECT_EQ(config.arguments[0], "serve");
	EXPECT_EQ(config.arguments[1], "--log-level=debug");
	EXPECT_EQ(config.GetSignature(), "sidecar serve");
	EXPECT_EQ(config.capture, CaptureMode::FILE);
	EXPECT_EQ(config.max_retries, 5u);
	EXPECT_EQ(config.startup_checks, 10u);
	EXPECT_EQ(config.startup_delay, std::chrono::milliseconds(250));
	EXPECT_EQ(config.stop_grace, std::chrono::milliseconds(1000));
	EXPECT_EQ(config.kill_wait, std::chrono::milliseconds(500));
	EXPECT_EQ(config.port_release, std::chrono::milliseconds(100));
	EXPECT_EQ(config.zombie_grace, std::chrono::milliseconds(200));
	EXPECT_EQ(config.retry_cooldown, std::chrono::milliseconds(300));
	EXPECT_EQ(config.command_timeout, std::chrono::milliseconds(4000));
	EXPECT_EQ(config.verbose, 5u);
}

TEST(SupervisorConfig, Variables)
{
	const auto config = Load(R"(@set prefix="/opt/sidecar"
executable "${prefix}/bin/sidecar"
)");

	EXPECT_EQ(config.executable, "/opt/sidecar/bin/sidecar");
}

TEST(SupervisorConfig, Errors)
{
	EXPECT_THROW(Load("no_such_option 1\n"), LineParser::Error);
	EXPECT_THROW(Load("enabled maybe\n"), LineParser::Error);
	EXPECT_THROW(Load("capture socket\n"), LineParser::Error);
	EXPECT_THROW(Load("max_retries 0\n"), LineParser::Error);
	EXPECT_THROW(Load("startup_checks\n"), LineParser::Error);
	EXPECT_THROW(Load("command_timeout_ms 0\n"), LineParser::Error);
}

TEST(SupervisorConfig, ErrorLocation)
{
	try {
		Load("verbose 3\n\nbogus\n");
		FAIL();
	} catch (const LineParser::Error &e) {
		const auto msg = GetFullMessage(e);
		EXPECT_NE(msg.find(":3"), msg.npos);
		EXPECT_NE(msg.find("Unknown option"), msg.npos);
	}
}
