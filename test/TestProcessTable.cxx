// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "supervisor/ProcessTable.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static constexpr auto proc_net_tcp =
	"  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
	"   0: 0100007F:2328 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 123456 1 0000000000000000 100 0 0 10 0\n"
	"   1: 00000000:0016 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 2222 1 0000000000000000 100 0 0 10 0\n"
	"   2: 0100007F:2328 0100007F:A1B2 01 00000000:00000000 00:00000000 00000000  1000        0 333333 1 0000000000000000 20 4 30 10 -1\n"
	"   3: 00000000:2328 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 444444 1 0000000000000000 100 0 0 10 0\n"sv;

static constexpr auto proc_net_tcp6 =
	"  sl  local_address                         remote_address                        st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
	"   0: 00000000000000000000000001000000:2328 00000000000000000000000000000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 555555 1 0000000000000000 100 0 0 10 0\n"sv;

TEST(ProcessTable, ProcNetTcp)
{
	/* 0x2328 == 9000; the established connection is ignored */
	const auto inodes = ParseProcNetTcp(proc_net_tcp, 9000);
	ASSERT_EQ(inodes.size(), 2u);
	EXPECT_EQ(inodes[0], 123456u);
	EXPECT_EQ(inodes[1], 444444u);

	EXPECT_EQ(ParseProcNetTcp(proc_net_tcp, 22).size(), 1u);
	EXPECT_TRUE(ParseProcNetTcp(proc_net_tcp, 9001).empty());
}

TEST(ProcessTable, ProcNetTcp6)
{
	const auto inodes = ParseProcNetTcp(proc_net_tcp6, 9000);
	ASSERT_EQ(inodes.size(), 1u);
	EXPECT_EQ(inodes[0], 555555u);
}

TEST(ProcessTable, ProcNetTcpMalformed)
{
	EXPECT_TRUE(ParseProcNetTcp(""sv, 9000).empty());
	EXPECT_TRUE(ParseProcNetTcp("header only\n"sv, 9000).empty());
	EXPECT_TRUE(ParseProcNetTcp("header\n 0: garbage\n\n"sv, 9000).empty());
}

TEST(ProcessTable, SocketLink)
{
	EXPECT_EQ(ParseSocketLink("socket:[123456]"), 123456u);
	EXPECT_FALSE(ParseSocketLink("pipe:[123456]"));
	EXPECT_FALSE(ParseSocketLink("socket:[]"));
	EXPECT_FALSE(ParseSocketLink("socket:[12x]"));
	EXPECT_FALSE(ParseSocketLink("/dev/null"));
}

TEST(ProcessTable, Lsof)
{
	const auto pids = ParseLsofOutput("123\n 456 \n\nfoo\n-1\n789"sv);
	ASSERT_EQ(pids.size(), 3u);
	EXPECT_EQ(pids[0], 123);
	EXPECT_EQ(pids[1], 456);
	EXPECT_EQ(pids[2], 789);
}

TEST(ProcessTable, Ps)
{
	const auto processes =
		ParsePsOutput("    1 /sbin/init\n"
			      "  4711 sidecar --port 9000 --host localhost\n"
			      "  4712\n"
			      "garbage line\n"sv);
	ASSERT_EQ(processes.size(), 2u);
	EXPECT_EQ(processes[0].pid, 1);
	EXPECT_EQ(processes[0].command, "/sbin/init");
	EXPECT_EQ(processes[1].pid, 4711);
	EXPECT_EQ(processes[1].command, "sidecar --port 9000 --host localhost");
}

TEST(ProcessTable, LaunchSignature)
{
	EXPECT_TRUE(MatchesLaunchSignature("/usr/bin/sidecar --port 9000 --host localhost",
					   "sidecar", 9000));
	EXPECT_TRUE(MatchesLaunchSignature("sidecar --host localhost --port=9000",
					   "sidecar", 9000));

	/* a different port, or a port number with the same prefix */
	EXPECT_FALSE(MatchesLaunchSignature("sidecar --port 9001", "sidecar", 9000));
	EXPECT_FALSE(MatchesLaunchSignature("sidecar --port 90000", "sidecar", 9000));

	/* no signature */
	EXPECT_FALSE(MatchesLaunchSignature("nginx --port 9000", "sidecar", 9000));
	EXPECT_FALSE(MatchesLaunchSignature("sidecar --port 9000", "", 9000));

	/* no port option */
	EXPECT_FALSE(MatchesLaunchSignature("sidecar 9000", "sidecar", 9000));
	EXPECT_FALSE(MatchesLaunchSignature("sidecar --port", "sidecar", 9000));
}
