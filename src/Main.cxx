// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Simulate a ranged request on a local file or a remote blob: the
 * status and the response headers are printed to stderr, the body
 * to stdout.
 */

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Notifier.hxx"
#include "RangedResponse.hxx"
#include "SourceAddress.hxx"
#include "Error.hxx"
#include "curl/Init.hxx"
#include "io/Logger.hxx"

#include <fmt/core.h>

#include <system_error>

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

static void
PrintHeaders(const RangedResponse &response)
{
	fmt::print(stderr, "HTTP/1.1 {}\n",
		   http_status_to_string(response.GetStatus()));

	for (const auto &[name, value] : response.GetHeaders())
		fmt::print(stderr, "{}: {}\n", name, value);

	fmt::print(stderr, "\n");
}

static void
WriteFull(int fd, std::span<const std::byte> src)
{
	while (!src.empty()) {
		ssize_t nbytes = write(fd, src.data(), src.size());
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw std::system_error(errno, std::system_category(),
						"Failed to write");
		}

		src = src.subspan(nbytes);
	}
}

/**
 * Copy the body to stdout.
 *
 * @return the number of bytes copied
 */
static uint64_t
CopyBody(RangedResponse &response)
{
	uint64_t total = 0;

	while (true) {
		const auto block = response.NextBlock();
		if (block.empty())
			break;

		WriteFull(STDOUT_FILENO, block);
		total += block.size();
	}

	return total;
}

int
main(int argc, char **argv)
try {
	CatCmdLine cmdline;
	StreamConfig config;
	ParseCommandLine(cmdline, config, argc, argv);

	const auto address = SourceAddress::Parse(cmdline.source);
	if (config.source_id.empty())
		config.source_id = address.location;

	const ScopeCurlInit curl_init;

	LoggingChunkNotifier notifier;

	auto response = NewRangedResponse(address, cmdline.range,
					  config, notifier);

	if (cmdline.print_headers)
		PrintHeaders(response);

	const uint64_t expected = response.GetContentLength();
	const uint64_t copied = CopyBody(response);

	if (copied != expected) {
		/* the headers have been sent already, there's nothing
		   we can do now */
		LogConcat(1, "main", "premature end of body: ",
			  copied, " of ", expected, " bytes");
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
} catch (...) {
	LogConcat(1, "main", std::current_exception());
	return EXIT_FAILURE;
}
