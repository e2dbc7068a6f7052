// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "RangedResponse.hxx"
#include "Config.hxx"
#include "SourceAddress.hxx"
#include "source/LocalChunkSource.hxx"
#include "source/RemoteChunkSource.hxx"
#include "remote/CurlChunkFetcher.hxx"
#include "io/Logger.hxx"
#include "Error.hxx"

#include <ranged-stream/ChunkEvent.hxx>

#include <optional>

static constexpr LLogger logger{"response"};

RangedResponse::RangedResponse(RangePlan &&_plan,
			       std::unique_ptr<ChunkSource> &&_source) noexcept
	:plan(std::move(_plan)), source(std::move(_source))
{
	if (!plan.HasBody())
		/* never iterate the source for a 416 response */
		source.reset();
}

/**
 * Announce the beginning of a response, before any byte is streamed.
 */
static void
NotifyReloaded(const ChunkSource &source, const RangePlan &plan,
	       const char *range_header) noexcept
{
	source.GetNotifier().OnChunkEvent({
			.start = int64_t(plan.range.start),
			.stop = int64_t(plan.HasBody()
					? plan.range.stop
					: plan.size),
			.source_id = source.GetSourceId(),
			.reloaded = true,
			.finished = false,
			.requested_range = range_header != nullptr
			? std::optional<std::string_view>{range_header}
			: std::nullopt,
		});
}

static void
LogPlan(const ChunkSource &source, const RangePlan &plan) noexcept
{
	logger.Fmt(4, "'{}' status={} range={}-{} size={}",
		   source.GetSourceId(), unsigned(plan.status),
		   plan.range.start, plan.range.stop, plan.size);
}

RangedResponse
NewLocalRangedResponse(std::unique_ptr<LocalChunkSource> &&source,
		       const char *range_header,
		       const StreamConfig &config)
{
	auto plan = PlanRangeResponse(range_header, source->GetSize(),
				      config.max_content_size);
	LogPlan(*source, plan);

	if (plan.HasBody())
		source->OpenAt(plan.range.start, plan.range.stop,
			       config.block_size);

	NotifyReloaded(*source, plan, range_header);

	return {std::move(plan), std::move(source)};
}

RangedResponse
NewRemoteRangedResponse(std::unique_ptr<RemoteChunkSource> &&source,
			const char *range_header,
			const StreamConfig &config)
{
	const auto deferred = range_header != nullptr
		? ParseDeferredRangeHeader(range_header)
		: std::nullopt;

	uint64_t start = 0, stop = ChunkSource::UNBOUNDED;

	if (deferred) {
		if (deferred->IsSuffix()) {
			/* the last N bytes, but we don't know the
			   size yet */
			const auto range = deferred->Resolve(source->ProbeSize());
			start = range.start;
			stop = range.stop;
		} else {
			start = uint64_t(deferred->start);
			if (deferred->HasStop())
				stop = deferred->stop;
		}

		/* the remote protocol needs the end offset up
		   front, therefore the limit is applied before the
		   session is opened */
		stop = ApplyMaxContentSize(start, stop,
					   config.max_content_size);
	}

	source->OpenAt(start, stop, config.block_size);

	const uint64_t size = source->GetSize();
	auto plan = PlanRangeResponse(deferred
				      ? std::optional<ByteRange>{deferred->Resolve(size)}
				      : std::nullopt,
				      size, config.max_content_size);
	LogPlan(*source, plan);

	NotifyReloaded(*source, plan, range_header);

	return {std::move(plan), std::move(source)};
}

RangedResponse
NewRangedResponse(const SourceAddress &address,
		  const char *range_header,
		  const StreamConfig &config,
		  RangedStream::ChunkNotifier &notifier)
{
	address.Check();

	switch (address.type) {
	case SourceAddress::Type::NONE:
		break;

	case SourceAddress::Type::LOCAL:
		return NewLocalRangedResponse(LocalChunkSource::Open(notifier,
								     config.source_id,
								     address.location.c_str()),
					      range_header, config);

	case SourceAddress::Type::REMOTE:
		return NewRemoteRangedResponse(std::make_unique<RemoteChunkSource>(notifier,
										   config.source_id,
										   std::make_unique<CurlChunkFetcher>(address.location.c_str(),
														      config.curl_timeout,
														      config.curl_verbose),
										   config.probe_size),
					       range_header, config);
	}

	throw UnsupportedSourceType("Undefined resource address");
}
