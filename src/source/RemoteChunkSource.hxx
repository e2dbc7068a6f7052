// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ChunkSource.hxx"
#include "remote/ChunkedDownload.hxx"

#include <memory>
#include <optional>
#include <vector>

class ChunkFetcher;

/**
 * A #ChunkSource reading a remote blob through a #ChunkedDownload,
 * one network chunk per block.
 *
 * The resource size is unknown until the first chunk has been
 * fetched, therefore OpenAt() fetches the first chunk eagerly.
 *
 * Block events are computed from a cursor which advances by the
 * nominal block size, not by the number of bytes actually received.
 * The byte stream itself is exact.
 */
class RemoteChunkSource final : public ChunkSource {
	std::unique_ptr<ChunkFetcher> fetcher;

	const std::size_t probe_size;

	std::optional<ChunkedDownload> download;

	/**
	 * The first chunk, fetched by OpenAt() and returned by the
	 * first NextBlock() call.
	 */
	std::vector<std::byte> initial_chunk;

	/**
	 * The chunk most recently returned by NextBlock().
	 */
	std::vector<std::byte> current_chunk;

	bool initial_pending = false;

	uint64_t size = 0;

	uint64_t position = 0, stop = 0;

	std::size_t block_size = DEFAULT_BLOCK_SIZE;

public:
	static constexpr std::size_t DEFAULT_PROBE_SIZE = 1024;

	RemoteChunkSource(RangedStream::ChunkNotifier &_notifier,
			  std::string_view _source_id,
			  std::unique_ptr<ChunkFetcher> &&_fetcher,
			  std::size_t _probe_size=DEFAULT_PROBE_SIZE) noexcept;

	~RemoteChunkSource() noexcept override;

	/**
	 * Learn the resource size before the window is known, by
	 * fetching a small probe chunk.  This is needed to resolve a
	 * suffix range ("the last N bytes").  The probe's bytes are
	 * discarded.
	 *
	 * Throws #SourceUnavailable on error.
	 *
	 * @return the size of the resource
	 */
	uint64_t ProbeSize();

	/* virtual methods from class ChunkSource */
	uint64_t GetSize() const noexcept override {
		return size;
	}

	/**
	 * Open the download session and fetch the first chunk.  If
	 * #stop is bounded, the session asks the server only for
	 * bytes before #stop.
	 */
	void OpenAt(uint64_t start, uint64_t stop,
		    std::size_t block_size) override;

	std::span<const std::byte> NextBlock() override;
};
