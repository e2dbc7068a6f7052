// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TestData.hxx"
#include "remote/ChunkResponse.hxx"
#include "Error.hxx"

#include <gtest/gtest.h>

static std::vector<std::byte>
ToBytes(std::string_view s)
{
	const auto *p = reinterpret_cast<const std::byte *>(s.data());
	return {p, p + s.size()};
}

TEST(ChunkResponse, Partial)
{
	const auto data = MakeTestData(1000);

	auto chunk = InterpretChunkResponse({
			.status = 206,
			.content_range = "bytes 200-455/1000",
			.content_length = 256,
			.body = ToBytes(std::string_view{data}.substr(200, 256)),
		}, 200, 256);

	EXPECT_EQ(chunk.total_size, 1000u);
	EXPECT_EQ(ToStringView(chunk.data), std::string_view{data}.substr(200, 256));
}

TEST(ChunkResponse, PartialMalformed)
{
	/* no Content-Range */
	EXPECT_THROW(InterpretChunkResponse({
				.status = 206,
				.body = ToBytes("abc"),
			}, 0, 3),
		SourceUnavailable);

	/* unknown total size */
	EXPECT_THROW(InterpretChunkResponse({
				.status = 206,
				.content_range = "bytes 0-2/*",
				.body = ToBytes("abc"),
			}, 0, 3),
		SourceUnavailable);

	/* wrong offset */
	EXPECT_THROW(InterpretChunkResponse({
				.status = 206,
				.content_range = "bytes 0-2/1000",
				.body = ToBytes("abc"),
			}, 100, 3),
		SourceUnavailable);
}

TEST(ChunkResponse, IgnoredRange)
{
	const auto data = MakeTestData(1000);

	/* the server sent the whole resource */
	auto chunk = InterpretChunkResponse({
			.status = 200,
			.content_length = 1000,
			.body = ToBytes(data),
		}, 900, 256);

	EXPECT_EQ(chunk.total_size, 1000u);
	EXPECT_EQ(ToStringView(chunk.data), std::string_view{data}.substr(900));

	/* beyond the end */
	chunk = InterpretChunkResponse({
			.status = 200,
			.body = ToBytes(data),
		}, 1500, 256);
	EXPECT_EQ(chunk.total_size, 1000u);
	EXPECT_TRUE(chunk.data.empty());
}

TEST(ChunkResponse, IgnoredRangeAborted)
{
	const auto data = MakeTestData(1000);

	/* the transfer was stopped after 300 bytes; the total is
	   taken from Content-Length */
	auto chunk = InterpretChunkResponse({
			.status = 200,
			.content_length = 1000,
			.body = ToBytes(std::string_view{data}.substr(0, 300)),
			.aborted = true,
		}, 100, 100);

	EXPECT_EQ(chunk.total_size, 1000u);
	EXPECT_EQ(ToStringView(chunk.data), std::string_view{data}.substr(100, 100));

	/* without Content-Length, the size is unknown */
	EXPECT_THROW(InterpretChunkResponse({
				.status = 200,
				.body = ToBytes(std::string_view{data}.substr(0, 300)),
				.aborted = true,
			}, 100, 100),
		SourceUnavailable);
}

TEST(ChunkResponse, NotSatisfiable)
{
	auto chunk = InterpretChunkResponse({
			.status = 416,
			.content_range = "bytes */1000",
		}, 1500, 256);

	EXPECT_EQ(chunk.total_size, 1000u);
	EXPECT_TRUE(chunk.data.empty());

	EXPECT_THROW(InterpretChunkResponse({.status = 416}, 1500, 256),
		     SourceUnavailable);
}

TEST(ChunkResponse, UnexpectedStatus)
{
	EXPECT_THROW(InterpretChunkResponse({.status = 404}, 0, 256),
		     SourceUnavailable);
	EXPECT_THROW(InterpretChunkResponse({.status = 500}, 0, 256),
		     SourceUnavailable);
}
