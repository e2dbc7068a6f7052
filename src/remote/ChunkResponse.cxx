// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ChunkResponse.hxx"
#include "http/ContentRange.hxx"
#include "Error.hxx"

#include <fmt/core.h>

#include <algorithm>

FetchedChunk
InterpretChunkResponse(ChunkResponse &&response,
		       uint64_t offset, uint64_t length)
{
	switch (response.status) {
	case 206:
		if (const auto cr = ParseContentRange(response.content_range);
		    cr && cr->satisfied && cr->complete_length &&
		    cr->first == offset)
			return {std::move(response.body), *cr->complete_length};

		throw SourceUnavailable(fmt::format("Malformed Content-Range: '{}'",
						    response.content_range));

	case 200:
		/* the server has ignored the "Range" header and sends
		   the whole resource; cut out the part we asked for */
		{
			if (response.aborted && !response.content_length)
				throw SourceUnavailable("Server ignores the Range header and sends no Content-Length");

			const uint64_t total = response.aborted
				? *response.content_length
				: response.body.size();
			const uint64_t end = std::min({
					total, offset + length,
					uint64_t(response.body.size()),
				});

			std::vector<std::byte> data;
			if (offset < end)
				data.assign(response.body.begin() + offset,
					    response.body.begin() + end);
			return {std::move(data), total};
		}

	case 416:
		if (const auto cr = ParseContentRange(response.content_range);
		    cr && cr->complete_length)
			return {{}, *cr->complete_length};

		throw SourceUnavailable("Range not satisfiable, but no resource size");

	default:
		throw SourceUnavailable(fmt::format("Unexpected status {}",
						    response.status));
	}
}
