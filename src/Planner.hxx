// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Decide the status and the body range of a response to a (possibly
 * ranged) request.
 */

#pragma once

#include "http/Range.hxx"
#include "http/Status.hxx"
#include "http/HeaderList.hxx"

#include <optional>

struct RangePlan {
	HttpStatus status;

	/**
	 * The body range.  Empty for
	 * #HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE; in that case,
	 * #range.start is the requested start and the source must
	 * not be iterated.
	 */
	ByteRange range;

	/**
	 * The total size of the resource.
	 */
	uint64_t size;

	HttpHeaderList headers;

	constexpr bool HasBody() const noexcept {
		return status != HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE;
	}

	constexpr bool IsPartial() const noexcept {
		return status == HttpStatus::PARTIAL_CONTENT;
	}
};

/**
 * @param requested the parsed "Range" header; std::nullopt if there
 * was none or if it was malformed
 * @param max_content_size never return more than this number of
 * bytes in a partial response; 0 means unlimited
 */
RangePlan
PlanRangeResponse(std::optional<ByteRange> requested, uint64_t size,
		  uint64_t max_content_size=0);

/**
 * Parse the "Range" request header (may be nullptr) and plan the
 * response.
 */
RangePlan
PlanRangeResponse(const char *range_header, uint64_t size,
		  uint64_t max_content_size=0);

/**
 * Apply the #max_content_size limit to the end of a partial range.
 *
 * @param stop the requested end; UINT64_MAX if unbounded
 */
constexpr uint64_t
ApplyMaxContentSize(uint64_t start, uint64_t stop,
		    uint64_t max_content_size) noexcept
{
	if (max_content_size > 0 && stop - start > max_content_size)
		stop = start + max_content_size;
	return stop;
}
