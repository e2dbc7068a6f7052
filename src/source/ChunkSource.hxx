// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <ranged-stream/ChunkEvent.hxx>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <stdint.h>

/**
 * Produces the bytes of a resource window [start, stop) as a lazy,
 * single-pass sequence of blocks of at most #block_size bytes.  Each
 * block is announced to the #ChunkNotifier before it is returned.
 *
 * Destroying the object releases the underlying file or network
 * session, regardless of whether the sequence has been consumed
 * completely.
 */
class ChunkSource {
	RangedStream::ChunkNotifier &notifier;

	const std::string source_id;

public:
	/**
	 * Pass this as "stop" to OpenAt() to read until the end of
	 * the resource.
	 */
	static constexpr uint64_t UNBOUNDED = UINT64_MAX;

	static constexpr std::size_t DEFAULT_BLOCK_SIZE = 1024 * 1024;

	ChunkSource(RangedStream::ChunkNotifier &_notifier,
		    std::string_view _source_id) noexcept
		:notifier(_notifier), source_id(_source_id) {}

	virtual ~ChunkSource() noexcept = default;

	ChunkSource(const ChunkSource &) = delete;
	ChunkSource &operator=(const ChunkSource &) = delete;

	std::string_view GetSourceId() const noexcept {
		return source_id;
	}

	RangedStream::ChunkNotifier &GetNotifier() const noexcept {
		return notifier;
	}

	/**
	 * The total size of the resource.  For remote sources, this
	 * is only known after OpenAt() has returned.
	 */
	virtual uint64_t GetSize() const noexcept = 0;

	/**
	 * Configure the window to be streamed.  Must be called once,
	 * before the first NextBlock() call.  A #stop beyond the end
	 * of the resource is clamped.
	 *
	 * Throws #SourceUnavailable on error.
	 */
	virtual void OpenAt(uint64_t start, uint64_t stop,
			    std::size_t block_size) = 0;

	/**
	 * Produce the next block.  The returned memory is owned by
	 * this object and remains valid until the next call.
	 *
	 * Throws #SourceUnavailable on error.
	 *
	 * @return the block or an empty span at the end of the window
	 */
	virtual std::span<const std::byte> NextBlock() = 0;

protected:
	/**
	 * Emit a per-block progress event.
	 */
	void NotifyBlock(uint64_t start, uint64_t stop,
			 bool finished) noexcept {
		notifier.OnChunkEvent({
				.start = int64_t(start),
				.stop = int64_t(stop),
				.source_id = source_id,
				.reloaded = false,
				.finished = finished,
				.requested_range = std::nullopt,
			});
	}
};
