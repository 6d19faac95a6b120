// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Logger.hxx"
#include "version.h"

#include <fmt/core.h>

#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>
#include <string.h>
#include <sysexits.h>

static void
PrintUsage()
{
	puts("usage: cm4all-beng-static [options]\n\n"
	     "valid options:\n"
	     " -h, --help              help (this text)\n"
	     " -V, --version           show cm4all-beng-static version\n"
	     " -v, --verbose           be more verbose\n"
	     " -q, --quiet             be quiet\n"
	     " -r, --document-root DIR serve files from this directory\n"
	     " -p, --port PORT         listen on this TCP port\n"
	     " -l, --listen ADDRESS    listen on this IP address\n"
	     " -s, --set NAME=VALUE    tweak a variable, e.g. \"etag=digest\",\n"
	     "                         \"directory_listing=no\",\n"
	     "                         \"content_type.EXT=TYPE\"\n"
	     );
}

template<typename... Args>
[[noreturn]]
static void
ArgError(const char *argv0, fmt::format_string<Args...> format_str,
	 Args&&... args) noexcept
{
	fmt::print(stderr, "{}: ", argv0);
	fmt::vprint(stderr, format_str, fmt::make_format_args(args...));
	fmt::print(stderr, "\nTry '{} --help' for more information.\n", argv0);
	exit(EX_USAGE);
}

static void
HandleSet(StaticConfig &config, const char *argv0, const char *p)
{
	const char *eq = strchr(p, '=');
	if (eq == nullptr)
		ArgError(argv0, "No '=' found in --set argument");

	if (eq == p)
		ArgError(argv0, "No name found in --set argument");

	const std::string_view name(p, eq - p);
	const char *const value = eq + 1;

	try {
		config.HandleSet(name, value);
	} catch (const std::runtime_error &e) {
		ArgError(argv0, "Error while parsing \"--set {}\": {}",
			 name, e.what());
	}
}

void
ParseCommandLine(StaticConfig &config, int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"document-root", 1, nullptr, 'r'},
		{"port", 1, nullptr, 'p'},
		{"listen", 1, nullptr, 'l'},
		{"set", 1, nullptr, 's'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;

	while (true) {
		int option_index = 0;
		const int ret = getopt_long(argc, argv, "hVvqr:p:l:s:",
					    long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(EXIT_SUCCESS);

		case 'V':
			printf("cm4all-beng-static v%s\n", VERSION);
			exit(EXIT_SUCCESS);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'r':
			if (*optarg == 0)
				ArgError(argv[0], "Empty document root");

			config.document_root = optarg;
			break;

		case 'p':
			try {
				config.port = ParsePort(optarg);
			} catch (const std::runtime_error &e) {
				ArgError(argv[0], "Invalid port '{}': {}",
					 optarg, e.what());
			}
			break;

		case 'l':
			if (*optarg == 0)
				ArgError(argv[0], "Empty listen address");

			config.listen_address = optarg;
			break;

		case 's':
			HandleSet(config, argv[0], optarg);
			break;

		case '?':
			fmt::print(stderr, "Try '{} --help' for more information.\n",
				   argv[0]);
			exit(EX_USAGE);

		default:
			exit(EX_USAGE);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind < argc)
		ArgError(argv[0], "unrecognized argument: {}", argv[optind]);
}
