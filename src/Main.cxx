// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "Logger.hxx"

#include <stdlib.h>
#include <signal.h>

int
main(int argc, char **argv)
try {
	/* configuration */
	StaticConfig config;
	ParseCommandLine(config, argc, argv);
	config.Finish();

	/* initialize */

	/* write errors on closed sockets are handled by libevent */
	signal(SIGPIPE, SIG_IGN);

	StaticInstance instance(config);
	instance.Listen();

	/* main loop */

	instance.Run();

	LogFmt(3, "main", "exiting");
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
