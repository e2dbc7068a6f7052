// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "RemoteChunkSource.hxx"
#include "remote/ChunkFetcher.hxx"
#include "io/Logger.hxx"

#include <algorithm>

#include <assert.h>

static constexpr LLogger logger{"remote"};

RemoteChunkSource::RemoteChunkSource(RangedStream::ChunkNotifier &_notifier,
				     std::string_view _source_id,
				     std::unique_ptr<ChunkFetcher> &&_fetcher,
				     std::size_t _probe_size) noexcept
	:ChunkSource(_notifier, _source_id),
	 fetcher(std::move(_fetcher)),
	 probe_size(_probe_size)
{
	assert(fetcher);
	assert(probe_size > 0);
}

RemoteChunkSource::~RemoteChunkSource() noexcept
{
	if (download && !download->IsFinished())
		logger.Fmt(4, "'{}' abandoned at {}", GetSourceId(), position);
}

uint64_t
RemoteChunkSource::ProbeSize()
{
	assert(!download);

	ChunkedDownload probe(*fetcher, 0, UNBOUNDED, probe_size);
	probe.ConsumeNextChunk();

	size = probe.GetTotalBytes();
	logger.Fmt(4, "'{}' size={}", GetSourceId(), size);
	return size;
}

void
RemoteChunkSource::OpenAt(uint64_t _start, uint64_t _stop,
			  std::size_t _block_size)
{
	assert(!download);
	assert(_block_size > 0);

	position = _start;
	block_size = _block_size;

	download.emplace(*fetcher, _start, std::max(_start, _stop),
			 block_size);

	/* the total size is only available after the first chunk
	   has been downloaded */
	initial_chunk = download->ConsumeNextChunk();
	initial_pending = true;

	/* an empty window is not fetched at all; the size may
	   already be known from ProbeSize() */
	if (download->HasTotalBytes())
		size = download->GetTotalBytes();
	stop = std::min(_stop, size);

	logger.Fmt(4, "'{}' {}-{} size={} block_size={}",
		   GetSourceId(), position, stop, size, block_size);
}

std::span<const std::byte>
RemoteChunkSource::NextBlock()
{
	assert(download);

	if (initial_pending) {
		/* the first block has already been fetched by
		   OpenAt() */
		initial_pending = false;
		current_chunk = std::move(initial_chunk);
	} else if (download->IsFinished()) {
		return {};
	} else {
		current_chunk = download->ConsumeNextChunk();
	}

	if (current_chunk.empty())
		return {};

	const uint64_t requested = position < stop
		? std::min<uint64_t>(block_size, stop - position)
		: 0;
	NotifyBlock(position, position + requested,
		    position + block_size >= size);

	/* advance by the nominal block size; if the server has sent
	   a short chunk, the event offsets drift from the real ones */
	position += block_size;

	return current_chunk;
}
