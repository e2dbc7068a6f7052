// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Definitions for the ranged-stream analytics events.
 */

#ifndef RANGED_STREAM_CHUNK_EVENT_HXX
#define RANGED_STREAM_CHUNK_EVENT_HXX

#include <optional>
#include <string_view>

#include <stdint.h>

namespace RangedStream {

/**
 * Describes one streamed block, or the beginning of a response.
 *
 * The string views point into memory owned by the sender and are
 * only valid during the ChunkNotifier::OnChunkEvent() call; a sink
 * which keeps the event must copy them.
 */
struct ChunkEvent {
	/**
	 * The first byte (inclusive).
	 */
	int64_t start;

	/**
	 * The end of the range (exclusive).
	 */
	int64_t stop;

	/**
	 * An opaque identifier which allows correlating events of
	 * one resource.
	 */
	std::string_view source_id;

	/**
	 * True for the one event fired when a response is
	 * constructed, i.e. the client (re)opened the resource at
	 * this offset.  False for per-block progress events.
	 */
	bool reloaded = false;

	/**
	 * Does this block reach the end of the whole resource (not
	 * only the end of the requested window)?
	 */
	bool finished = false;

	/**
	 * The raw "Range" request header; only set on the
	 * #reloaded event, and only if the client sent one.
	 */
	std::optional<std::string_view> requested_range = std::nullopt;
};

/**
 * A sink for #ChunkEvent instances.
 */
class ChunkNotifier {
public:
	virtual void OnChunkEvent(const ChunkEvent &event) noexcept = 0;

protected:
	~ChunkNotifier() noexcept = default;
};

} // namespace RangedStream

#endif
