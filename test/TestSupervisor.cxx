// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecordingSidecarHandler.hxx"
#include "TestPorts.hxx"
#include "supervisor/Supervisor.hxx"
#include "supervisor/TenantRegistry.hxx"
#include "supervisor/AuthConfig.hxx"
#include "supervisor/Error.hxx"
#include "net/PortProbe.hxx"
#include "event/Loop.hxx"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

using namespace std::chrono_literals;
using ::testing::HasSubstr;

static constexpr const char *PRIMARY_URL = "http://localhost:8000/mcp";

static SupervisorConfig
MakeConfig() noexcept
{
	SupervisorConfig config;
	config.executable = FAKE_SIDECAR_PATH;
	config.max_retries = 2;
	config.startup_checks = 50;
	config.startup_delay = 100ms;
	config.stop_grace = 1s;
	config.kill_wait = 1s;
	config.port_release = 200ms;
	config.zombie_grace = 200ms;
	config.retry_cooldown = 100ms;
	config.command_timeout = 5s;
	config.verbose = 1;
	return config;
}

static AuthConfig
MakeApiKeyAuth(unsigned port, const char *api_key="k1",
	       const char *host="localhost")
{
	AuthConfig auth{AuthMode::API_KEY};
	auth.Set("host", host);
	auth.Set("port", std::to_string(port));
	auth.Set("api_key", api_key);
	return auth;
}

static AuthConfig
MakeOAuthAuth(unsigned port)
{
	AuthConfig auth{AuthMode::OAUTH};
	auth.Set("oauth_host", "localhost");
	auth.Set("oauth_port", std::to_string(port));
	auth.Set("oauth_server_url", "http://localhost:9999");
	auth.Set("oauth_auth_url", "https://idp.example.com/authorize");
	auth.Set("oauth_token_url", "https://idp.example.com/token");
	auth.Set("oauth_client_id", "client");
	auth.Set("oauth_client_secret", "s3cret");
	return auth;
}

class SupervisorTest : public ::testing::Test {
protected:
	EventLoop event_loop;

	std::unique_ptr<Supervisor> supervisor;

	void SetUp() override {
		Create(MakeConfig());
	}

	void TearDown() override {
		supervisor.reset();
	}

	void Create(const SupervisorConfig &config) {
		supervisor.reset();
		supervisor = std::make_unique<Supervisor>(event_loop, config);
	}

	void Start(RecordingSidecarHandler &handler, const char *tenant,
		   const AuthConfig *auth) noexcept {
		supervisor->Start(tenant, PRIMARY_URL, auth,
				  handler, handler.cancel_ptr);
	}

	RecordingSidecarHandler &StartAndWait(RecordingSidecarHandler &handler,
					      const char *tenant,
					      const AuthConfig &auth) noexcept {
		Start(handler, tenant, &auth);
		handler.Wait();
		return handler;
	}

	void StopAndWait(const char *tenant) {
		RecordingSidecarHandler handler{event_loop};
		supervisor->Stop(tenant, handler, handler.cancel_ptr);
		handler.Wait();

		ASSERT_TRUE(handler.done);
		ASSERT_TRUE(handler.stopped) << handler.GetErrorMessage();
	}

	pid_t GetPid(const char *tenant) noexcept {
		const auto *entry = supervisor->GetRegistry().Find(tenant);
		return entry != nullptr ? entry->pid : -1;
	}
};

TEST_F(SupervisorTest, StartAndStop)
{
	const unsigned port = AllocateFreePort();
	const auto auth = MakeApiKeyAuth(port);

	RecordingSidecarHandler handler{event_loop};
	StartAndWait(handler, "a", auth);

	ASSERT_TRUE(handler.done);
	ASSERT_FALSE(handler.error) << handler.GetErrorMessage();
	EXPECT_EQ(handler.port, port);

	EXPECT_EQ(supervisor->GetPort("a"), port);
	EXPECT_FALSE(supervisor->GetLastError("a"));
	EXPECT_TRUE(supervisor->IsRunning("a"));
	EXPECT_FALSE(IsPortFree(port));
	EXPECT_EQ(supervisor->GetRegistry().GetPortOwner(port), "a");
	EXPECT_EQ(supervisor->GetRegistry().GetPidOwner(GetPid("a")), "a");

	StopAndWait("a");

	EXPECT_FALSE(supervisor->GetPort("a"));
	EXPECT_FALSE(supervisor->IsRunning("a"));
	EXPECT_FALSE(supervisor->GetRegistry().GetPortOwner(port));
	EXPECT_TRUE(supervisor->GetTenants().empty());
	EXPECT_TRUE(IsPortFree(port));
}

TEST_F(SupervisorTest, StopWithoutSidecar)
{
	StopAndWait("nobody");
	EXPECT_FALSE(supervisor->GetPort("nobody"));
}

TEST_F(SupervisorTest, OAuth)
{
	const unsigned port = AllocateFreePort();
	const auto auth = MakeOAuthAuth(port);

	RecordingSidecarHandler handler{event_loop};
	StartAndWait(handler, "a", auth);

	ASSERT_FALSE(handler.error) << handler.GetErrorMessage();
	EXPECT_EQ(handler.port, port);
}

TEST_F(SupervisorTest, AlreadyRunning)
{
	const unsigned port = AllocateFreePort();
	const auto auth = MakeApiKeyAuth(port);

	RecordingSidecarHandler first{event_loop};
	StartAndWait(first, "a", auth);
	ASSERT_FALSE(first.error) << first.GetErrorMessage();
	const pid_t pid = GetPid("a");

	RecordingSidecarHandler second{event_loop};
	StartAndWait(second, "a", auth);
	ASSERT_FALSE(second.error) << second.GetErrorMessage();
	EXPECT_EQ(second.port, port);
	EXPECT_EQ(GetPid("a"), pid);
}

TEST_F(SupervisorTest, RestartOnChange)
{
	const unsigned port = AllocateFreePort();

	RecordingSidecarHandler first{event_loop};
	StartAndWait(first, "a", MakeApiKeyAuth(port, "k1"));
	ASSERT_FALSE(first.error) << first.GetErrorMessage();
	const pid_t pid = GetPid("a");

	RecordingSidecarHandler second{event_loop};
	StartAndWait(second, "a", MakeApiKeyAuth(port, "k2"));
	ASSERT_FALSE(second.error) << second.GetErrorMessage();
	EXPECT_EQ(second.port, port);
	EXPECT_NE(GetPid("a"), pid);
	EXPECT_EQ(supervisor->GetRegistry().GetPidOwner(pid), std::nullopt);
}

TEST_F(SupervisorTest, RestartOnOAuthChange)
{
	const unsigned port = AllocateFreePort();

	RecordingSidecarHandler first{event_loop};
	StartAndWait(first, "a", MakeOAuthAuth(port));
	ASSERT_FALSE(first.error) << first.GetErrorMessage();
	const pid_t pid = GetPid("a");

	auto changed = MakeOAuthAuth(port);
	changed.Set("oauth_client_id", "other-client");

	RecordingSidecarHandler second{event_loop};
	StartAndWait(second, "a", changed);
	ASSERT_FALSE(second.error) << second.GetErrorMessage();
	EXPECT_EQ(second.port, port);

	const pid_t new_pid = GetPid("a");
	EXPECT_NE(new_pid, pid);
	EXPECT_EQ(supervisor->GetTenants().size(), 1U);

	/* the same settings again do not restart it a second time */
	RecordingSidecarHandler third{event_loop};
	StartAndWait(third, "a", changed);
	ASSERT_FALSE(third.error) << third.GetErrorMessage();
	EXPECT_EQ(GetPid("a"), new_pid);
}

TEST_F(SupervisorTest, MovePort)
{
	const unsigned old_port = AllocateFreePort();

	RecordingSidecarHandler first{event_loop};
	StartAndWait(first, "a", MakeApiKeyAuth(old_port));
	ASSERT_FALSE(first.error) << first.GetErrorMessage();

	const unsigned new_port = AllocateFreePort();
	auto auth = MakeOAuthAuth(new_port);

	RecordingSidecarHandler second{event_loop};
	StartAndWait(second, "a", auth);
	ASSERT_FALSE(second.error) << second.GetErrorMessage();
	EXPECT_EQ(supervisor->GetPort("a"), new_port);
	EXPECT_FALSE(supervisor->GetRegistry().GetPortOwner(old_port));
	EXPECT_TRUE(IsPortFree(old_port));
}

TEST_F(SupervisorTest, PortConflict)
{
	const unsigned port = AllocateFreePort();

	RecordingSidecarHandler first{event_loop};
	StartAndWait(first, "a", MakeApiKeyAuth(port));
	ASSERT_FALSE(first.error) << first.GetErrorMessage();

	RecordingSidecarHandler second{event_loop};
	StartAndWait(second, "b", MakeApiKeyAuth(port));
	ASSERT_TRUE(second.done);
	EXPECT_TRUE(IsErrorType<PortConflictError>(second.error));
	EXPECT_THAT(second.GetErrorMessage(),
		    HasSubstr("already in use by another project"));

	const auto last_error = supervisor->GetLastError("b");
	ASSERT_TRUE(last_error);
	EXPECT_THAT(*last_error, HasSubstr("another project"));

	/* the first tenant is unaffected */
	EXPECT_TRUE(supervisor->IsRunning("a"));
	EXPECT_EQ(supervisor->GetPort("a"), port);
	EXPECT_FALSE(supervisor->GetPort("b"));
}

TEST_F(SupervisorTest, ForeignProcess)
{
	const unsigned port = AllocateFreePort();
	const PortBlocker blocker{port};

	RecordingSidecarHandler handler{event_loop};
	StartAndWait(handler, "a", MakeApiKeyAuth(port));
	ASSERT_TRUE(handler.done);
	EXPECT_TRUE(IsErrorType<PortConflictError>(handler.error));
	EXPECT_THAT(handler.GetErrorMessage(),
		    HasSubstr("another application"));

	/* the foreign listener has survived */
	EXPECT_FALSE(IsPortFree(port));
}

TEST_F(SupervisorTest, MissingSecret)
{
	auto auth = MakeOAuthAuth(AllocateFreePort());
	auth.Erase("oauth_client_secret");

	RecordingSidecarHandler handler{event_loop};
	Start(handler, "a", &auth);

	/* reported synchronously, nothing has been launched */
	ASSERT_TRUE(handler.done);
	EXPECT_TRUE(IsErrorType<ConfigurationError>(handler.error));
	EXPECT_THAT(handler.GetErrorMessage(),
		    HasSubstr("Missing required fields: oauth_client_secret"));
	EXPECT_FALSE(supervisor->GetPort("a"));

	const auto last_error = supervisor->GetLastError("a");
	ASSERT_TRUE(last_error);
	EXPECT_THAT(*last_error, HasSubstr("oauth_client_secret"));
}

TEST_F(SupervisorTest, NoAuth)
{
	RecordingSidecarHandler handler{event_loop};
	Start(handler, "a", nullptr);

	ASSERT_TRUE(handler.done);
	EXPECT_TRUE(IsErrorType<ConfigurationError>(handler.error));
	EXPECT_EQ(handler.GetErrorMessage(), "No auth settings provided");
}

TEST_F(SupervisorTest, InvalidPort)
{
	AuthConfig auth{AuthMode::API_KEY};
	auth.Set("host", "localhost");
	auth.Set("port", "http");

	RecordingSidecarHandler handler{event_loop};
	Start(handler, "a", &auth);

	ASSERT_TRUE(handler.done);
	EXPECT_TRUE(IsErrorType<ConfigurationError>(handler.error));

	auth.Set("port", "0");

	RecordingSidecarHandler second{event_loop};
	StartAndWait(second, "a", auth);
	ASSERT_TRUE(second.done);
	EXPECT_TRUE(IsErrorType<ConfigurationError>(second.error));
	EXPECT_THAT(second.GetErrorMessage(),
		    HasSubstr("between 1 and 65535"));
}

TEST_F(SupervisorTest, ClassifiedStartupError)
{
	auto config = MakeConfig();
	config.arguments = {
		"--behavior=error",
		"--message=OSError: [Errno 98] Address already in use",
	};
	Create(config);

	RecordingSidecarHandler handler{event_loop};
	StartAndWait(handler, "a", MakeOAuthAuth(AllocateFreePort()));

	ASSERT_TRUE(handler.done);
	ASSERT_FALSE(handler.timed_out);
	EXPECT_TRUE(IsErrorType<StartupError>(handler.error));
	EXPECT_EQ(handler.GetErrorMessage(),
		  "Address http://localhost:9999 is already in use.");
	EXPECT_EQ(supervisor->GetLastError("a"),
		  "Address http://localhost:9999 is already in use.");
	EXPECT_FALSE(supervisor->GetPort("a"));
}

TEST_F(SupervisorTest, GenericStartupError)
{
	auto config = MakeConfig();
	config.arguments = {"--behavior=exit"};
	Create(config);

	RecordingSidecarHandler handler{event_loop};
	StartAndWait(handler, "a", MakeApiKeyAuth(AllocateFreePort()));

	ASSERT_TRUE(handler.done);
	EXPECT_TRUE(IsErrorType<StartupError>(handler.error));
	EXPECT_EQ(handler.GetErrorMessage(), GENERIC_STARTUP_ERROR_MESSAGE);
}

TEST_F(SupervisorTest, NeverBinds)
{
	auto config = MakeConfig();
	config.arguments = {"--behavior=hang"};
	config.max_retries = 1;
	config.startup_checks = 3;
	Create(config);

	RecordingSidecarHandler handler{event_loop};
	StartAndWait(handler, "a", MakeApiKeyAuth(AllocateFreePort()));

	ASSERT_TRUE(handler.done);
	EXPECT_TRUE(IsErrorType<StartupError>(handler.error));
	EXPECT_FALSE(supervisor->GetPort("a"));
}

TEST_F(SupervisorTest, StartOptions)
{
	auto config = MakeConfig();
	config.arguments = {"--behavior=hang"};
	Create(config);

	StartOptions options = supervisor->GetDefaultStartOptions();
	options.max_retries = 0;
	options.max_startup_checks = 2;
	options.startup_delay = 50ms;

	const auto auth = MakeApiKeyAuth(AllocateFreePort());

	RecordingSidecarHandler handler{event_loop};
	supervisor->Start("a", PRIMARY_URL, {}, &auth, options,
			  handler, handler.cancel_ptr);
	handler.Wait();

	/* a budget of zero still makes one attempt */
	ASSERT_TRUE(handler.done);
	EXPECT_TRUE(IsErrorType<StartupError>(handler.error));
}

TEST_F(SupervisorTest, Supersede)
{
	const auto auth1 = MakeApiKeyAuth(AllocateFreePort(), "k1");
	const unsigned port2 = AllocateFreePort();
	const auto auth2 = MakeApiKeyAuth(port2, "k2");

	RecordingSidecarHandler first{event_loop}, second{event_loop};
	Start(first, "a", &auth1);
	Start(second, "a", &auth2);

	ASSERT_TRUE(first.done);
	EXPECT_TRUE(IsErrorType<SupersededError>(first.error));

	second.Wait();
	ASSERT_FALSE(second.error) << second.GetErrorMessage();
	EXPECT_EQ(second.port, port2);
	EXPECT_EQ(supervisor->GetPort("a"), port2);
}

TEST_F(SupervisorTest, SupersedeAfterLaunch)
{
	auto config = MakeConfig();
	config.arguments = {"--hang-on-host=127.0.0.1"};
	Create(config);

	const unsigned port1 = AllocateFreePort();
	const auto auth1 = MakeApiKeyAuth(port1, "k1", "127.0.0.1");
	const unsigned port2 = AllocateFreePort();
	const auto auth2 = MakeApiKeyAuth(port2, "k2");

	/* the first process is running but never binds */
	RecordingSidecarHandler first{event_loop};
	Start(first, "a", &auth1);
	first.Wait(1500ms);
	ASSERT_FALSE(first.done);

	RecordingSidecarHandler second{event_loop};
	Start(second, "a", &auth2);

	ASSERT_TRUE(first.done);
	EXPECT_TRUE(IsErrorType<SupersededError>(first.error));
	EXPECT_FALSE(supervisor->GetRegistry().GetPortReservation(port1));

	second.Wait();
	ASSERT_FALSE(second.error) << second.GetErrorMessage();
	EXPECT_EQ(supervisor->GetPort("a"), port2);
	EXPECT_FALSE(supervisor->GetRegistry().GetPortOwner(port1));
	EXPECT_EQ(supervisor->GetTenants().size(), 1U);
}

TEST_F(SupervisorTest, StopWaitsForStart)
{
	const unsigned port = AllocateFreePort();
	const auto auth = MakeApiKeyAuth(port);

	RecordingSidecarHandler start{event_loop}, stop{event_loop};
	Start(start, "a", &auth);
	supervisor->Stop("a", stop, stop.cancel_ptr);

	start.Wait();
	ASSERT_FALSE(start.error) << start.GetErrorMessage();
	EXPECT_EQ(start.port, port);

	stop.Wait();
	ASSERT_TRUE(stop.stopped);
	EXPECT_FALSE(supervisor->GetPort("a"));
	EXPECT_TRUE(IsPortFree(port));
}

TEST_F(SupervisorTest, StopAll)
{
	const unsigned port1 = AllocateFreePort(), port2 = AllocateFreePort();

	RecordingSidecarHandler a{event_loop}, b{event_loop};
	StartAndWait(a, "a", MakeApiKeyAuth(port1));
	StartAndWait(b, "b", MakeApiKeyAuth(port2));
	ASSERT_FALSE(a.error) << a.GetErrorMessage();
	ASSERT_FALSE(b.error) << b.GetErrorMessage();
	ASSERT_NE(port1, port2);

	/* a pending start is superseded */
	const auto auth3 = MakeApiKeyAuth(AllocateFreePort());
	RecordingSidecarHandler c{event_loop};
	Start(c, "c", &auth3);

	RecordingSidecarHandler all{event_loop};
	supervisor->StopAll(all, all.cancel_ptr);

	ASSERT_TRUE(c.done);
	EXPECT_TRUE(IsErrorType<SupersededError>(c.error));

	all.Wait();

	ASSERT_TRUE(all.stopped);
	EXPECT_TRUE(supervisor->GetTenants().empty());
	EXPECT_TRUE(IsPortFree(port1));
	EXPECT_TRUE(IsPortFree(port2));
}

TEST_F(SupervisorTest, StopIgnoresTerm)
{
	auto config = MakeConfig();
	config.arguments = {"--ignore-term"};
	config.stop_grace = 200ms;
	Create(config);

	const unsigned port = AllocateFreePort();

	RecordingSidecarHandler handler{event_loop};
	StartAndWait(handler, "a", MakeApiKeyAuth(port));
	ASSERT_FALSE(handler.error) << handler.GetErrorMessage();

	/* SIGTERM is ignored; the stop escalates to SIGKILL */
	StopAndWait("a");

	EXPECT_FALSE(supervisor->IsRunning("a"));
	EXPECT_FALSE(supervisor->GetRegistry().GetPortOwner(port));
	EXPECT_TRUE(supervisor->GetTenants().empty());
	EXPECT_TRUE(IsPortFree(port));
}

TEST_F(SupervisorTest, Disabled)
{
	auto config = MakeConfig();
	config.enabled = false;
	Create(config);

	const auto auth = MakeApiKeyAuth(AllocateFreePort());

	RecordingSidecarHandler start{event_loop};
	Start(start, "a", &auth);
	ASSERT_TRUE(start.done);
	EXPECT_TRUE(IsErrorType<DisabledError>(start.error));
	EXPECT_EQ(start.GetErrorMessage(),
		  "Sidecar support is disabled in settings");

	RecordingSidecarHandler stop{event_loop};
	supervisor->Stop("a", stop, stop.cancel_ptr);
	ASSERT_TRUE(stop.done);
	EXPECT_TRUE(IsErrorType<DisabledError>(stop.error));

	RecordingSidecarHandler all{event_loop};
	supervisor->StopAll(all, all.cancel_ptr);
	ASSERT_TRUE(all.done);
	EXPECT_FALSE(all.stopped);
	EXPECT_TRUE(IsErrorType<DisabledError>(all.error));

	EXPECT_THROW(supervisor->GetPort("a"), DisabledError);
	EXPECT_THROW(supervisor->GetLastError("a"), DisabledError);
}

TEST_F(SupervisorTest, CancelStart)
{
	const unsigned port = AllocateFreePort();
	const auto auth = MakeApiKeyAuth(port);

	RecordingSidecarHandler handler{event_loop};
	Start(handler, "a", &auth);
	handler.cancel_ptr.Cancel();

	/* the tenant is not locked anymore */
	StopAndWait("a");
	EXPECT_FALSE(handler.done);
	EXPECT_FALSE(supervisor->GetPort("a"));
}

TEST_F(SupervisorTest, CancelAfterLaunch)
{
	auto config = MakeConfig();
	config.arguments = {"--behavior=hang"};
	Create(config);

	const unsigned port = AllocateFreePort();
	const auto auth = MakeApiKeyAuth(port);

	RecordingSidecarHandler handler{event_loop};
	Start(handler, "a", &auth);

	/* the process has been spawned and is being polled */
	handler.Wait(1500ms);
	ASSERT_FALSE(handler.done);
	ASSERT_TRUE(supervisor->GetRegistry().GetPortReservation(port));

	handler.cancel_ptr.Cancel();
	EXPECT_FALSE(supervisor->GetRegistry().GetPortReservation(port));

	StopAndWait("a");
	EXPECT_FALSE(handler.done);
	EXPECT_FALSE(supervisor->IsRunning("a"));
	EXPECT_FALSE(supervisor->GetPort("a"));
	EXPECT_TRUE(IsPortFree(port));
}
