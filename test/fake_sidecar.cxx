// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A stand-in for the sidecar executable which understands its
 * command line and can be told to misbehave:
 *
 *   --behavior=bind   listen on HOST:PORT until SIGTERM (default)
 *   --behavior=exit   exit immediately without output
 *   --behavior=error  print --message=TEXT to stderr and exit
 *   --behavior=hang   never bind the port
 *   --hang-on-host=H  like "hang" if HOST equals H
 *   --ignore-term     ignore SIGTERM
 *   --exit-code=N     the exit status for "exit" and "error"
 */

#include "sidecar/Protocol.hxx"

#include <cstdlib>
#include <string>
#include <string_view>

#include <errno.h>
#include <netdb.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

struct Options {
	std::string host = "localhost";
	std::string port;

	std::string_view behavior = "bind"sv;
	std::string_view message;

	std::string_view hang_on_host;

	int exit_code = 1;

	bool ignore_term = false;
};

static bool
ParseOptionValue(std::string_view arg, std::string_view name,
		 std::string_view &value) noexcept
{
	if (!arg.starts_with(name) || arg.size() <= name.size() ||
	    arg[name.size()] != '=')
		return false;

	value = arg.substr(name.size() + 1);
	return true;
}

static Options
ParseCommandLine(int argc, char **argv)
{
	Options o;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		std::string_view value;

		if (arg == Sidecar::OPTION_PORT && i + 1 < argc)
			o.port = argv[++i];
		else if (arg == Sidecar::OPTION_HOST && i + 1 < argc)
			o.host = argv[++i];
		else if (arg == Sidecar::OPTION_ENV && i + 2 < argc)
			i += 2;
		else if ((arg == Sidecar::OPTION_MODE ||
			  arg == Sidecar::OPTION_ENDPOINT ||
			  arg == Sidecar::OPTION_SSE_URL ||
			  arg == Sidecar::OPTION_AUTH_TYPE) && i + 1 < argc)
			++i;
		else if (ParseOptionValue(arg, "--behavior"sv, value))
			o.behavior = value;
		else if (ParseOptionValue(arg, "--hang-on-host"sv, value))
			o.hang_on_host = value;
		else if (ParseOptionValue(arg, "--message"sv, value))
			o.message = value;
		else if (ParseOptionValue(arg, "--exit-code"sv, value))
			o.exit_code = atoi(std::string{value}.c_str());
		else if (arg == "--ignore-term"sv)
			o.ignore_term = true;
		else {
			fprintf(stderr, "Unknown option: %s\n", argv[i]);
			exit(2);
		}
	}

	if (!o.hang_on_host.empty() && o.host == o.hang_on_host)
		o.behavior = "hang"sv;

	return o;
}

static int
Listen(const Options &o)
{
	struct addrinfo hints{};
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = AI_PASSIVE;

	struct addrinfo *ai;
	int result = getaddrinfo(o.host.c_str(), o.port.c_str(), &hints, &ai);
	if (result != 0) {
		fprintf(stderr, "Failed to resolve %s: %s\n",
			o.host.c_str(), gai_strerror(result));
		return -1;
	}

	int fd = -1;
	for (const struct addrinfo *i = ai; i != nullptr; i = i->ai_next) {
		fd = socket(i->ai_family, i->ai_socktype, i->ai_protocol);
		if (fd < 0)
			continue;

		const int one = 1;
		setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

		if (bind(fd, i->ai_addr, i->ai_addrlen) == 0 &&
		    listen(fd, 16) == 0)
			break;

		fprintf(stderr, "bind to port %s failed: %s\n",
			o.port.c_str(), strerror(errno));
		close(fd);
		fd = -1;
	}

	freeaddrinfo(ai);
	return fd;
}

int
main(int argc, char **argv)
{
	const auto o = ParseCommandLine(argc, argv);

	if (o.ignore_term)
		signal(SIGTERM, SIG_IGN);

	if (o.behavior == "exit"sv)
		return o.exit_code;

	if (o.behavior == "error"sv) {
		fprintf(stderr, "%.*s\n",
			int(o.message.size()), o.message.data());
		return o.exit_code;
	}

	if (o.behavior == "bind"sv) {
		if (Listen(o) < 0)
			return EXIT_FAILURE;

		printf("Listening on %s:%s\n", o.host.c_str(), o.port.c_str());
		fflush(stdout);
	} else if (o.behavior != "hang"sv) {
		fprintf(stderr, "Unknown behavior\n");
		return 2;
	}

	while (true)
		pause();
}
