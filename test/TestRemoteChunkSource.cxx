// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "MemoryChunkFetcher.hxx"
#include "RecordingChunkNotifier.hxx"
#include "TestData.hxx"
#include "source/RemoteChunkSource.hxx"
#include "http/Range.hxx"
#include "Error.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

using Request = MemoryChunkFetcher::Request;

namespace {

struct RemoteFixture {
	RecordingChunkNotifier notifier;

	MemoryChunkFetcher *fetcher;

	RemoteChunkSource source;

	explicit RemoteFixture(std::string_view data,
			       std::size_t max_response=0)
		:RemoteFixture(std::make_unique<MemoryChunkFetcher>(data,
								      max_response)) {}

	std::string ReadAll() {
		std::string result;

		while (true) {
			const auto block = source.NextBlock();
			if (block.empty())
				break;

			result.append(ToStringView(block));
		}

		return result;
	}

private:
	explicit RemoteFixture(std::unique_ptr<MemoryChunkFetcher> &&_fetcher)
		:fetcher(_fetcher.get()),
		 source(notifier, "foo", std::move(_fetcher), 64) {}
};

}

TEST(RemoteChunkSource, Whole)
{
	const auto data = MakeTestData(1000);
	RemoteFixture f(data);

	f.source.OpenAt(0, ChunkSource::UNBOUNDED, 256);

	/* the first chunk is fetched eagerly and reveals the size */
	EXPECT_EQ(f.source.GetSize(), 1000u);
	EXPECT_EQ(f.fetcher->requests.size(), 1u);
	EXPECT_TRUE(f.notifier.events.empty());

	EXPECT_EQ(f.ReadAll(), data);
	EXPECT_EQ(f.fetcher->requests,
		  (std::vector<Request>{{0, 256}, {256, 256}, {512, 256}, {768, 256}}));

	ASSERT_EQ(f.notifier.events.size(), 4u);
	for (std::size_t i = 0; i < 4; ++i) {
		const auto &e = f.notifier.events[i];
		EXPECT_EQ(e.start, int64_t(i * 256));
		EXPECT_EQ(e.stop, int64_t(std::min<std::size_t>((i + 1) * 256, 1000)));
		EXPECT_EQ(e.source_id, "foo");
		EXPECT_FALSE(e.reloaded);
		EXPECT_EQ(e.finished, i == 3);
	}

	EXPECT_TRUE(f.source.NextBlock().empty());
}

TEST(RemoteChunkSource, Window)
{
	const auto data = MakeTestData(1000);
	RemoteFixture f(data);

	f.source.OpenAt(200, 500, 256);
	EXPECT_EQ(f.ReadAll(), data.substr(200, 300));

	/* nothing beyond the window is requested */
	EXPECT_EQ(f.fetcher->requests,
		  (std::vector<Request>{{200, 256}, {456, 44}}));

	ASSERT_EQ(f.notifier.events.size(), 2u);
	EXPECT_EQ(f.notifier.events[0].start, 200);
	EXPECT_EQ(f.notifier.events[0].stop, 456);
	EXPECT_EQ(f.notifier.events[1].start, 456);
	EXPECT_EQ(f.notifier.events[1].stop, 500);
	EXPECT_FALSE(f.notifier.events[1].finished);
}

TEST(RemoteChunkSource, WindowFinished)
{
	const auto data = MakeTestData(1000);
	RemoteFixture f(data);

	f.source.OpenAt(700, 800, 512);
	EXPECT_EQ(f.ReadAll(), data.substr(700, 100));
	EXPECT_EQ(f.fetcher->requests,
		  (std::vector<Request>{{700, 100}}));

	ASSERT_EQ(f.notifier.events.size(), 1u);
	EXPECT_EQ(f.notifier.events[0].start, 700);
	EXPECT_EQ(f.notifier.events[0].stop, 800);
	EXPECT_TRUE(f.notifier.events[0].finished);
}

TEST(RemoteChunkSource, Suffix)
{
	const auto data = MakeTestData(1000);
	RemoteFixture f(data);

	const auto range = ParseDeferredRangeHeader("bytes=-100");
	ASSERT_TRUE(range);

	const uint64_t size = f.source.ProbeSize();
	EXPECT_EQ(size, 1000u);

	const auto resolved = range->Resolve(size);
	EXPECT_EQ(resolved, (ByteRange{900, 1000}));

	f.source.OpenAt(resolved.start, resolved.stop, 256);
	EXPECT_EQ(f.ReadAll(), data.substr(900));

	/* one size request plus one chunk */
	EXPECT_EQ(f.fetcher->requests,
		  (std::vector<Request>{{0, 64}, {900, 256}}));

	ASSERT_EQ(f.notifier.events.size(), 1u);
	EXPECT_EQ(f.notifier.events[0].start, 900);
	EXPECT_EQ(f.notifier.events[0].stop, 1000);
	EXPECT_TRUE(f.notifier.events[0].finished);
}

TEST(RemoteChunkSource, SuffixLargerThanResource)
{
	const auto data = MakeTestData(1000);
	RemoteFixture f(data);

	const auto range = ParseDeferredRangeHeader("bytes=-5000");
	ASSERT_TRUE(range);
	EXPECT_EQ(range->Resolve(f.source.ProbeSize()), (ByteRange{0, 1000}));
}

TEST(RemoteChunkSource, EmptySuffixWindow)
{
	RemoteFixture f(std::string_view{});

	EXPECT_EQ(f.source.ProbeSize(), 0u);

	/* nothing to fetch, but the size is still known */
	f.source.OpenAt(0, 0, 256);
	EXPECT_EQ(f.source.GetSize(), 0u);
	EXPECT_EQ(f.fetcher->requests.size(), 1u);
	EXPECT_TRUE(f.source.NextBlock().empty());
}

TEST(RemoteChunkSource, BeyondEnd)
{
	const auto data = MakeTestData(1000);
	RemoteFixture f(data);

	f.source.OpenAt(1500, ChunkSource::UNBOUNDED, 256);
	EXPECT_EQ(f.source.GetSize(), 1000u);
	EXPECT_TRUE(f.source.NextBlock().empty());
	EXPECT_TRUE(f.notifier.events.empty());
}

TEST(RemoteChunkSource, Empty)
{
	RemoteFixture f(std::string_view{});

	f.source.OpenAt(0, ChunkSource::UNBOUNDED, 256);
	EXPECT_EQ(f.source.GetSize(), 0u);
	EXPECT_TRUE(f.source.NextBlock().empty());
	EXPECT_TRUE(f.notifier.events.empty());
}

TEST(RemoteChunkSource, ShortChunks)
{
	const auto data = MakeTestData(1000);
	RemoteFixture f(data, 100);

	f.source.OpenAt(0, ChunkSource::UNBOUNDED, 256);

	/* the byte stream is exact even though the event cursor
	   advances by the nominal block size */
	EXPECT_EQ(f.ReadAll(), data);
	EXPECT_EQ(f.fetcher->requests.size(), 10u);
	EXPECT_EQ(f.notifier.events.size(), 10u);
	EXPECT_EQ(f.notifier.events[1].start, 256);
}

TEST(RemoteChunkSource, OpenError)
{
	RecordingChunkNotifier notifier;
	RemoteChunkSource source(notifier, "foo",
				 std::make_unique<FailingChunkFetcher>(MakeTestData(1000), 0));

	EXPECT_THROW(source.OpenAt(0, ChunkSource::UNBOUNDED, 256),
		     SourceUnavailable);
}

TEST(RemoteChunkSource, NextBlockError)
{
	RecordingChunkNotifier notifier;
	RemoteChunkSource source(notifier, "foo",
				 std::make_unique<FailingChunkFetcher>(MakeTestData(1000), 1));

	source.OpenAt(0, ChunkSource::UNBOUNDED, 256);
	EXPECT_EQ(source.NextBlock().size(), 256u);
	EXPECT_THROW(source.NextBlock(), SourceUnavailable);
}
