// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TestPorts.hxx"
#include "net/PortProbe.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(PortProbe, ValidPort)
{
	EXPECT_FALSE(IsValidPort(0));
	EXPECT_TRUE(IsValidPort(1));
	EXPECT_TRUE(IsValidPort(65535));
	EXPECT_FALSE(IsValidPort(65536));
}

TEST(PortProbe, InvalidArguments)
{
	EXPECT_THROW(IsPortFree(0), std::invalid_argument);
	EXPECT_THROW(IsPortFree(70000), std::invalid_argument);
	EXPECT_THROW(IsPortFree(8080, ""), std::invalid_argument);
	EXPECT_THROW(IsPortFree(8080, "no-such-host.invalid"),
		     std::invalid_argument);
}

TEST(PortProbe, FreeAndOccupied)
{
	const unsigned port = AllocateFreePort();
	EXPECT_TRUE(IsPortFree(port));
	EXPECT_TRUE(IsPortFree(port, "127.0.0.1"));

	{
		const PortBlocker blocker{port};
		EXPECT_FALSE(IsPortFree(port));
		EXPECT_FALSE(IsPortFree(port, "127.0.0.1"));
	}

	/* the probe itself must not leave anything behind */
	EXPECT_TRUE(IsPortFree(port));
	EXPECT_TRUE(IsPortFree(port));
}
