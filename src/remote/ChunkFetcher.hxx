// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <vector>

#include <stdint.h>

struct FetchedChunk {
	std::vector<std::byte> data;

	/**
	 * The size of the whole resource as reported by the server.
	 */
	uint64_t total_size;
};

/**
 * Fetches byte ranges of one remote resource.  Each call is one
 * blocking network round trip.
 */
class ChunkFetcher {
public:
	virtual ~ChunkFetcher() noexcept = default;

	/**
	 * Fetch up to #length bytes beginning at #offset.  If
	 * #offset is at or beyond the end of the resource, the
	 * result is empty, but #FetchedChunk::total_size is still
	 * set.
	 *
	 * Throws #SourceUnavailable on error.
	 */
	virtual FetchedChunk Fetch(uint64_t offset, uint64_t length) = 0;
};
