// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ChunkFetcher.hxx"

#include <optional>
#include <string_view>
#include <vector>

/**
 * What the HTTP client has received in response to one ranged
 * "GET" request.
 */
struct ChunkResponse {
	unsigned status;

	/**
	 * The "Content-Range" header; empty if there was none.
	 */
	std::string_view content_range;

	std::optional<uint64_t> content_length;

	std::vector<std::byte> body;

	/**
	 * Was the transfer aborted after the requested range had
	 * arrived?  Only used for status 200, i.e. when the server
	 * ignores the "Range" header.  #body is then incomplete.
	 */
	bool aborted = false;
};

/**
 * Extract the requested chunk and the resource size from the
 * response to a request for bytes [offset, offset+length).
 *
 * Throws #SourceUnavailable if the response is unusable.
 */
FetchedChunk
InterpretChunkResponse(ChunkResponse &&response,
		       uint64_t offset, uint64_t length);
