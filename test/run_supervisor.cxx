// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Start one sidecar and keep it running until SIGINT or SIGTERM.
 *
 * usage: run_supervisor CONFIG TENANT PORT PRIMARY_URL [api-key|oauth [NAME=VALUE...]]
 */

#include "supervisor/Supervisor.hxx"
#include "supervisor/Handler.hxx"
#include "supervisor/AuthConfig.hxx"
#include "event/Loop.hxx"
#include "event/SignalEvent.hxx"
#include "io/Logger.hxx"
#include "util/Cancellable.hxx"
#include "util/PrintException.hxx"

#include <string>
#include <string_view>

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

class RunSupervisor final : SidecarStartHandler, SidecarStopHandler {
	EventLoop event_loop;

	Supervisor supervisor;

	SignalEvent sigint{event_loop, SIGINT, BIND_THIS_METHOD(OnSignal)};
	SignalEvent sigterm{event_loop, SIGTERM, BIND_THIS_METHOD(OnSignal)};

	const std::string tenant;

	CancellablePointer cancel_ptr;

	bool stopping = false, finished = false;

public:
	bool success = false;

	RunSupervisor(const SupervisorConfig &config, std::string_view _tenant)
		:supervisor(event_loop, config), tenant(_tenant) {
		sigint.Enable();
		sigterm.Enable();
	}

	void Start(std::string_view primary_url, const AuthConfig &auth) noexcept {
		supervisor.Start(tenant, primary_url, &auth, *this, cancel_ptr);
	}

	void Run() noexcept {
		/* the start may have failed synchronously */
		if (!finished)
			event_loop.Run();
	}

private:
	void Shutdown() noexcept {
		finished = true;
		sigint.Disable();
		sigterm.Disable();
		event_loop.Break();
	}

	void OnSignal(int) noexcept {
		if (stopping)
			return;

		stopping = true;

		if (cancel_ptr)
			/* still starting */
			cancel_ptr.Cancel();

		supervisor.Stop(tenant, *this, cancel_ptr);
	}

	/* virtual methods from class SidecarStartHandler */
	void OnSidecarReady(unsigned port) noexcept override {
		cancel_ptr = nullptr;
		success = true;
		printf("sidecar of '%s' is listening on port %u\n",
		       tenant.c_str(), port);
		fflush(stdout);
	}

	void OnSidecarError(std::exception_ptr error) noexcept override {
		cancel_ptr = nullptr;
		PrintException(error);
		Shutdown();
	}

	/* virtual methods from class SidecarStopHandler */
	void OnSidecarStopped() noexcept override {
		cancel_ptr = nullptr;
		Shutdown();
	}

	void OnSidecarStopError(std::exception_ptr error) noexcept override {
		cancel_ptr = nullptr;
		success = false;
		PrintException(error);
		Shutdown();
	}
};

static AuthConfig
ParseAuth(int argc, char **argv, const char *port)
{
	AuthConfig auth{argc > 0 ? ParseAuthMode(argv[0]) : AuthMode::NONE};

	const bool oauth = auth.mode == AuthMode::OAUTH;
	auth.Set(oauth ? "oauth_host" : "host", "localhost");
	auth.Set(oauth ? "oauth_port" : "port", port);

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		const auto eq = arg.find('=');
		if (eq == arg.npos)
			throw std::invalid_argument{"Malformed NAME=VALUE argument"};

		auth.Set(arg.substr(0, eq), arg.substr(eq + 1));
	}

	return auth;
}

int
main(int argc, char **argv) noexcept
try {
	if (argc < 5) {
		fprintf(stderr, "usage: run_supervisor CONFIG TENANT PORT PRIMARY_URL [api-key|oauth [NAME=VALUE...]]\n");
		return EXIT_FAILURE;
	}

	SupervisorConfig config;
	LoadSupervisorConfig(config, argv[1]);
	SetLogLevel(config.verbose);

	const auto auth = ParseAuth(argc - 5, argv + 5, argv[3]);

	RunSupervisor instance{config, argv[2]};
	instance.Start(argv[4], auth);
	instance.Run();

	return instance.success ? EXIT_SUCCESS : EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
