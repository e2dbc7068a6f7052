// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Planner.hxx"
#include "source/ChunkSource.hxx"

#include <memory>
#include <span>

struct StreamConfig;
struct SourceAddress;
class LocalChunkSource;
class RemoteChunkSource;
namespace RangedStream { class ChunkNotifier; }

/**
 * The response to one (possibly ranged) request for a resource: the
 * status and headers to be sent by the HTTP server, and the body as
 * a sequence of blocks.
 *
 * Destroying this object releases the resource.
 */
class RangedResponse {
	RangePlan plan;

	/**
	 * The body; nullptr if there is none (status 416) or after
	 * Abandon().
	 */
	std::unique_ptr<ChunkSource> source;

public:
	RangedResponse(RangePlan &&_plan,
		       std::unique_ptr<ChunkSource> &&_source) noexcept;

	RangedResponse(RangedResponse &&) noexcept = default;
	RangedResponse &operator=(RangedResponse &&) noexcept = default;

	HttpStatus GetStatus() const noexcept {
		return plan.status;
	}

	const HttpHeaderList &GetHeaders() const noexcept {
		return plan.headers;
	}

	const ByteRange &GetRange() const noexcept {
		return plan.range;
	}

	uint64_t GetSize() const noexcept {
		return plan.size;
	}

	/**
	 * The number of body bytes the client has been promised.
	 */
	uint64_t GetContentLength() const noexcept {
		return plan.HasBody() ? plan.range.GetLength() : 0;
	}

	/**
	 * Produce the next body block.
	 *
	 * Throws #SourceUnavailable on error.
	 *
	 * @return the block or an empty span at the end of the body
	 */
	std::span<const std::byte> NextBlock() {
		if (!source)
			return {};

		return source->NextBlock();
	}

	/**
	 * Release the resource before the body has been consumed
	 * completely, e.g. because the client has disconnected.
	 */
	void Abandon() noexcept {
		source.reset();
	}
};

/**
 * Plan a response for a local file and emit the "reloaded" event.
 *
 * @param range_header the "Range" request header or nullptr
 */
RangedResponse
NewLocalRangedResponse(std::unique_ptr<LocalChunkSource> &&source,
		       const char *range_header,
		       const StreamConfig &config);

/**
 * Resolve the range (which may need a probe request to learn the
 * resource size), fetch the first chunk, plan the response and emit
 * the "reloaded" event.
 *
 * Throws #SourceUnavailable on error.
 *
 * @param range_header the "Range" request header or nullptr
 */
RangedResponse
NewRemoteRangedResponse(std::unique_ptr<RemoteChunkSource> &&source,
			const char *range_header,
			const StreamConfig &config);

/**
 * Open the resource described by #address and construct a
 * #RangedResponse for it.
 *
 * Throws #UnsupportedSourceType or #SourceUnavailable on error.
 */
RangedResponse
NewRangedResponse(const SourceAddress &address,
		  const char *range_header,
		  const StreamConfig &config,
		  RangedStream::ChunkNotifier &notifier);
