// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

struct StreamConfig;

struct CatCmdLine {
	/**
	 * The local path or the remote URL.
	 */
	const char *source = nullptr;

	/**
	 * The value of the simulated "Range" request header.
	 */
	const char *range = nullptr;

	/**
	 * Print the status and the headers to stderr?
	 */
	bool print_headers = true;
};

/**
 * Parse the command line.  Exits the process on error.
 */
void
ParseCommandLine(CatCmdLine &cmdline, StreamConfig &config,
		 int argc, char **argv);
