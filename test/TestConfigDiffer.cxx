// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "supervisor/ConfigDiffer.hxx"
#include "supervisor/AuthConfig.hxx"

#include <gtest/gtest.h>

static AuthConfig
MakeOAuthConfig()
{
	AuthConfig c{AuthMode::OAUTH};
	c.Set("oauth_host", "localhost");
	c.Set("oauth_port", "9000");
	c.Set("oauth_client_id", "client");
	c.Set("oauth_client_secret", "s3cret");
	return c;
}

TEST(ConfigDiffer, Null)
{
	const auto c = MakeOAuthConfig();

	EXPECT_FALSE(HasAuthConfigChanged(nullptr, nullptr));
	EXPECT_TRUE(HasAuthConfigChanged(&c, nullptr));
	EXPECT_TRUE(HasAuthConfigChanged(nullptr, &c));
}

TEST(ConfigDiffer, Identical)
{
	const auto a = MakeOAuthConfig(), b = MakeOAuthConfig();
	EXPECT_FALSE(HasAuthConfigChanged(&a, &b));
}

TEST(ConfigDiffer, ModeChange)
{
	const auto a = MakeOAuthConfig();
	auto b = MakeOAuthConfig();
	b.mode = AuthMode::NONE;

	EXPECT_TRUE(HasAuthConfigChanged(&a, &b));
}

TEST(ConfigDiffer, OAuthFieldChange)
{
	const auto a = MakeOAuthConfig();

	auto b = MakeOAuthConfig();
	b.Set("oauth_client_secret", "other");
	EXPECT_TRUE(HasAuthConfigChanged(&a, &b));

	/* a field which appears only on one side */
	b = MakeOAuthConfig();
	b.Set("oauth_provider_scope", "openid");
	EXPECT_TRUE(HasAuthConfigChanged(&a, &b));
	EXPECT_TRUE(HasAuthConfigChanged(&b, &a));
}

TEST(ConfigDiffer, OAuthListenAddress)
{
	auto a = MakeOAuthConfig();
	a.Set("host", "localhost");
	a.Set("port", "8000");

	auto b = a;
	b.Set("port", "8001");
	EXPECT_TRUE(HasAuthConfigChanged(&a, &b));
}

TEST(ConfigDiffer, OAuthIgnoresOtherFields)
{
	const auto a = MakeOAuthConfig();

	auto b = MakeOAuthConfig();
	b.Set("api_key", "whatever");
	b.Set("comment", "not relevant");
	EXPECT_FALSE(HasAuthConfigChanged(&a, &b));
}

TEST(ConfigDiffer, EmptyEqualsAbsent)
{
	const auto a = MakeOAuthConfig();

	auto b = MakeOAuthConfig();
	b.Set("oauth_mcp_scope", "");
	EXPECT_FALSE(HasAuthConfigChanged(&a, &b));
}

TEST(ConfigDiffer, ApiKey)
{
	AuthConfig a{AuthMode::API_KEY};
	a.Set("api_key", "one");

	AuthConfig b = a;
	b.Set("oauth_client_id", "ignored");
	EXPECT_FALSE(HasAuthConfigChanged(&a, &b));

	b.Set("api_key", "two");
	EXPECT_TRUE(HasAuthConfigChanged(&a, &b));
}

TEST(ConfigDiffer, None)
{
	AuthConfig a{AuthMode::NONE}, b{AuthMode::NONE};
	b.Set("api_key", "ignored");
	b.Set("oauth_client_id", "ignored");

	EXPECT_FALSE(HasAuthConfigChanged(&a, &b));
}
