// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <vector>

#include <stdint.h>

class ChunkFetcher;

/**
 * Downloads a window of a remote resource in chunks of a fixed size,
 * one request per chunk.  The size of the resource is learned from
 * the first response.
 */
class ChunkedDownload {
	ChunkFetcher &fetcher;

	const uint64_t start;

	/**
	 * The end of the window (exclusive); UINT64_MAX if
	 * unbounded.
	 */
	const uint64_t end;

	const std::size_t chunk_size;

	uint64_t bytes_downloaded = 0;

	uint64_t total_bytes = 0;

	bool have_total_bytes = false;

	bool finished = false;

public:
	ChunkedDownload(ChunkFetcher &_fetcher,
			uint64_t _start, uint64_t _end,
			std::size_t _chunk_size) noexcept;

	ChunkedDownload(const ChunkedDownload &) = delete;
	ChunkedDownload &operator=(const ChunkedDownload &) = delete;

	bool IsFinished() const noexcept {
		return finished;
	}

	bool HasTotalBytes() const noexcept {
		return have_total_bytes;
	}

	/**
	 * The size of the whole resource.  Only valid after the
	 * first ConsumeNextChunk() call.
	 */
	uint64_t GetTotalBytes() const noexcept {
		return total_bytes;
	}

	uint64_t GetBytesDownloaded() const noexcept {
		return bytes_downloaded;
	}

	/**
	 * Fetch the next chunk.  Must not be called after
	 * IsFinished() has returned true.  An empty chunk finishes
	 * the download.
	 *
	 * Throws #SourceUnavailable on error.
	 */
	std::vector<std::byte> ConsumeNextChunk();
};
