// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ChunkFetcher.hxx"
#include "curl/Easy.hxx"

#include <chrono>
#include <optional>
#include <span>
#include <string>

/**
 * A #ChunkFetcher which sends one HTTP "GET" request with a "Range"
 * header per chunk.  The CURL handle is reused, which allows libcurl
 * to keep the connection alive between chunks.
 */
class CurlChunkFetcher final : public ChunkFetcher {
	const std::string url;

	CurlEasy easy;

	/**
	 * The body of the current response.
	 */
	std::vector<std::byte> body;

	/**
	 * The "Content-Range" header of the current response.
	 */
	std::string content_range;

	/**
	 * The "Content-Length" header of the current response.
	 */
	std::optional<uint64_t> content_length;

	/**
	 * If the server ignores the "Range" header (status 200), the
	 * transfer is aborted as soon as this many bytes have been
	 * received.
	 */
	uint64_t want_bytes;

	bool aborted;

public:
	/**
	 * Throws std::runtime_error on error.
	 *
	 * @param timeout the timeout of each request; zero means no
	 * timeout
	 */
	CurlChunkFetcher(const char *_url,
			 std::chrono::seconds timeout, bool verbose);

	/* virtual methods from class ChunkFetcher */
	FetchedChunk Fetch(uint64_t offset, uint64_t length) override;

private:
	void OnHeader(std::string_view line) noexcept;
	std::size_t OnData(std::span<const std::byte> src) noexcept;

	static std::size_t HeaderFunction(char *ptr, std::size_t size,
					  std::size_t nmemb,
					  void *userdata) noexcept;
	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *userdata) noexcept;
};
