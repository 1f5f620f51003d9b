// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "supervisor/AuthConfig.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

static AuthConfig
MakeOAuthConfig()
{
	AuthConfig c{AuthMode::OAUTH};
	c.Set("oauth_host", "localhost");
	c.Set("oauth_port", "9000");
	c.Set("oauth_server_url", "http://localhost:9000");
	c.Set("oauth_auth_url", "https://idp.example.com/authorize");
	c.Set("oauth_token_url", "https://idp.example.com/token");
	c.Set("oauth_client_id", "client");
	c.Set("oauth_client_secret", "s3cret");
	return c;
}

static std::string
GetValidationError(const AuthConfig &c)
{
	try {
		ValidateAuthConfig(c);
	} catch (const std::invalid_argument &e) {
		return e.what();
	}

	return {};
}

TEST(AuthConfig, ParseMode)
{
	EXPECT_EQ(ParseAuthMode("none"), AuthMode::NONE);
	EXPECT_EQ(ParseAuthMode("api-key"), AuthMode::API_KEY);
	EXPECT_EQ(ParseAuthMode("apikey"), AuthMode::API_KEY);
	EXPECT_EQ(ParseAuthMode("oauth"), AuthMode::OAUTH);
	EXPECT_THROW(ParseAuthMode("OAuth2"), std::invalid_argument);

	EXPECT_STREQ(ToString(AuthMode::API_KEY), "api-key");
}

TEST(AuthConfig, Get)
{
	AuthConfig c;
	EXPECT_EQ(c.Find("foo"), nullptr);
	EXPECT_TRUE(c.Get("foo").empty());

	c.Set("foo", "bar");
	ASSERT_NE(c.Find("foo"), nullptr);
	EXPECT_EQ(c.Get("foo"), "bar");

	c.Erase("foo");
	EXPECT_EQ(c.Find("foo"), nullptr);
}

TEST(AuthConfig, ValidateComplete)
{
	EXPECT_NO_THROW(ValidateAuthConfig(MakeOAuthConfig()));
}

TEST(AuthConfig, ValidateOnlyOAuth)
{
	/* other modes have no required fields */
	EXPECT_NO_THROW(ValidateAuthConfig(AuthConfig{AuthMode::NONE}));
	EXPECT_NO_THROW(ValidateAuthConfig(AuthConfig{AuthMode::API_KEY}));
}

TEST(AuthConfig, ValidateMissing)
{
	auto c = MakeOAuthConfig();
	c.Erase("oauth_client_secret");

	EXPECT_EQ(GetValidationError(c),
		  "Invalid OAuth configuration: Missing required fields: oauth_client_secret");
}

TEST(AuthConfig, ValidateMissingAndEmpty)
{
	auto c = MakeOAuthConfig();
	c.Erase("oauth_auth_url");
	c.Erase("oauth_token_url");
	c.Set("oauth_client_id", "");
	c.Set("oauth_client_secret", "   ");

	EXPECT_EQ(GetValidationError(c),
		  "Invalid OAuth configuration: "
		  "Missing required fields: oauth_auth_url, oauth_token_url; "
		  "Empty required fields: oauth_client_id, oauth_client_secret");
}

TEST(AuthConfig, ListenAddress)
{
	auto c = MakeOAuthConfig();
	auto a = GetListenAddress(c);
	EXPECT_EQ(a.host, "localhost");
	EXPECT_EQ(a.port, 9000u);

	/* fallback to the generic fields */
	c.Erase("oauth_host");
	c.Erase("oauth_port");
	c.Set("host", "127.0.0.1");
	c.Set("port", " 9100 ");
	a = GetListenAddress(c);
	EXPECT_EQ(a.host, "127.0.0.1");
	EXPECT_EQ(a.port, 9100u);
}

TEST(AuthConfig, ListenAddressErrors)
{
	AuthConfig c{AuthMode::OAUTH};
	EXPECT_THROW(GetListenAddress(c), std::invalid_argument);

	c.Set("oauth_port", "http");
	c.Set("oauth_host", "localhost");
	EXPECT_THROW(GetListenAddress(c), std::invalid_argument);

	c.Set("oauth_port", "9000");
	c.Erase("oauth_host");
	EXPECT_THROW(GetListenAddress(c), std::invalid_argument);

	/* the range is checked by the port arbitration */
	c.Set("oauth_host", "localhost");
	c.Set("oauth_port", "0");
	EXPECT_EQ(GetListenAddress(c).port, 0u);
}
