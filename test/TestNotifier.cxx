// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "RecordingChunkNotifier.hxx"
#include "Notifier.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(ChunkNotifierList, Order)
{
	RecordingChunkNotifier a, b;
	NullChunkNotifier null;

	ChunkNotifierList list;
	list.Add(a);
	list.Add(null);
	list.Add(b);

	list.OnChunkEvent({
			.start = 0,
			.stop = 100,
			.source_id = "foo"sv,
			.reloaded = true,
			.finished = false,
			.requested_range = "bytes=0-99"sv,
		});

	list.OnChunkEvent({
			.start = 0,
			.stop = 100,
			.source_id = "foo"sv,
			.reloaded = false,
			.finished = true,
			.requested_range = std::nullopt,
		});

	ASSERT_EQ(a.events.size(), 2u);
	EXPECT_EQ(a.events, b.events);
	EXPECT_TRUE(a.events[0].reloaded);
	EXPECT_EQ(a.events[0].requested_range, "bytes=0-99");
	EXPECT_TRUE(a.events[1].finished);
	EXPECT_EQ(a.GetBlockEvents().size(), 1u);
}

TEST(ChunkNotifierList, Logging)
{
	LoggingChunkNotifier logging;
	RecordingChunkNotifier recording;

	ChunkNotifierList list;
	list.Add(logging);
	list.Add(recording);

	list.OnChunkEvent({
			.start = 10,
			.stop = 20,
			.source_id = "foo"sv,
			.reloaded = false,
			.finished = false,
			.requested_range = std::nullopt,
		});

	ASSERT_EQ(recording.events.size(), 1u);
	EXPECT_EQ(recording.events[0].source_id, "foo");
	EXPECT_FALSE(recording.events[0].reloaded);
}
