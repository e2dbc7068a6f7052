// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ChunkedDownload.hxx"
#include "ChunkFetcher.hxx"
#include "Error.hxx"

#include <fmt/core.h>

#include <algorithm>

#include <assert.h>

ChunkedDownload::ChunkedDownload(ChunkFetcher &_fetcher,
				 uint64_t _start, uint64_t _end,
				 std::size_t _chunk_size) noexcept
	:fetcher(_fetcher), start(_start), end(_end),
	 chunk_size(_chunk_size)
{
	assert(chunk_size > 0);
	assert(start <= end);
}

std::vector<std::byte>
ChunkedDownload::ConsumeNextChunk()
{
	assert(!finished);

	const uint64_t offset = start + bytes_downloaded;
	const uint64_t length = std::min<uint64_t>(chunk_size, end - offset);

	if (length == 0) {
		finished = true;
		return {};
	}

	auto chunk = fetcher.Fetch(offset, length);
	if (chunk.data.size() > length)
		throw SourceUnavailable(fmt::format("Received {} bytes, but only {} were requested",
						    chunk.data.size(), length));

	total_bytes = chunk.total_size;
	have_total_bytes = true;

	bytes_downloaded += chunk.data.size();

	if (chunk.data.empty() ||
	    start + bytes_downloaded >= std::min(end, total_bytes))
		finished = true;

	return std::move(chunk.data);
}
