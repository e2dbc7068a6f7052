// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "io/Logger.hxx"
#include "version.h"

#include <fmt/core.h>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

static void
PrintUsage()
{
	puts("usage: ranged-cat [options] PATH|URL\n\n"
	     "valid options:\n"
	     " --help\n"
	     " -h             help (this text)\n"
	     " --version\n"
	     " -V             show ranged-cat version\n"
	     " --verbose\n"
	     " -v             be more verbose\n"
	     " --quiet\n"
	     " -q             be quiet\n"
	     " --range VALUE\n"
	     " -r VALUE       the \"Range\" request header, e.g. \"bytes=0-99\"\n"
	     " --no-headers\n"
	     " -n             don't print the status and the headers\n"
	     " --set NAME=VALUE  tweak an internal variable, see manual for details\n"
	     " -s NAME=VALUE  \n"
	     "\n");
}

[[noreturn]]
static void
arg_error(const char *argv0, std::string_view msg)
{
	if (!msg.empty())
		fmt::print(stderr, "{}: {}\n", argv0, msg);

	fmt::print(stderr, "Try '{} --help' for more information.\n",
		   argv0);
	exit(1);
}

void
ParseCommandLine(CatCmdLine &cmdline, StreamConfig &config,
		 int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"range", 1, nullptr, 'r'},
		{"no-headers", 0, nullptr, 'n'},
		{"set", 1, nullptr, 's'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;

	while (true) {
		int option_index = 0;

		int ret = getopt_long(argc, argv, "hVvqr:ns:",
				      long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'V':
			printf("ranged-cat v%s\n", RANGED_STREAM_VERSION);
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'r':
			cmdline.range = optarg;
			break;

		case 'n':
			cmdline.print_headers = false;
			break;

		case 's':
			try {
				config.HandleSet(optarg);
			} catch (const std::runtime_error &e) {
				arg_error(argv[0], GetFullMessage(e));
			}
			break;

		case '?':
			arg_error(argv[0], {});

		default:
			exit(1);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind >= argc)
		arg_error(argv[0], "PATH or URL missing");

	cmdline.source = argv[optind++];

	if (optind < argc)
		arg_error(argv[0], fmt::format("unrecognized argument: {}",
					       argv[optind]));
}
