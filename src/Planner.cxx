// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Planner.hxx"

#include <fmt/core.h>

#include <algorithm>

RangePlan
PlanRangeResponse(std::optional<ByteRange> requested, uint64_t size,
		  uint64_t max_content_size)
{
	RangePlan plan{HttpStatus::OK, {0, size}, size, {}};

	plan.headers.Add("accept-ranges", "bytes");

	if (!requested)
		return plan;

	if (requested->start >= size) {
		plan.status = HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE;
		plan.range = {requested->start, requested->start};
		plan.headers.Add("content-range",
				 fmt::format("bytes */{}", size));
		return plan;
	}

	/* the client may ask for more than we have */
	const uint64_t stop = ApplyMaxContentSize(requested->start,
						  std::min(requested->stop, size),
						  max_content_size);

	plan.status = HttpStatus::PARTIAL_CONTENT;
	plan.range = {requested->start, stop};
	plan.headers.Add("content-range",
			 fmt::format("bytes {}-{}/{}",
				     plan.range.start, plan.range.stop - 1,
				     size));
	plan.headers.Add("content-length",
			 fmt::format("{}", plan.range.GetLength()));
	return plan;
}

RangePlan
PlanRangeResponse(const char *range_header, uint64_t size,
		  uint64_t max_content_size)
{
	return PlanRangeResponse(range_header != nullptr
				 ? ParseRangeHeader(range_header, size)
				 : std::nullopt,
				 size, max_content_size);
}
