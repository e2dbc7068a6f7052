// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "Error.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(Config, Defaults)
{
	const StreamConfig config;
	EXPECT_EQ(config.block_size, 1024u * 1024u);
	EXPECT_EQ(config.max_content_size, 0u);
	EXPECT_TRUE(config.source_id.empty());
	EXPECT_EQ(config.probe_size, 1024u);
	EXPECT_EQ(config.curl_timeout, std::chrono::seconds(60));
	EXPECT_FALSE(config.curl_verbose);
}

TEST(Config, Set)
{
	StreamConfig config;

	config.HandleSet("block_size=64k");
	EXPECT_EQ(config.block_size, 65536u);

	config.HandleSet("max_content_size=2M");
	EXPECT_EQ(config.max_content_size, 2u * 1024 * 1024);

	config.HandleSet("max_content_size=0");
	EXPECT_EQ(config.max_content_size, 0u);

	config.HandleSet("source_id=movie.mp4");
	EXPECT_EQ(config.source_id, "movie.mp4");

	config.HandleSet("source_id=a=b");
	EXPECT_EQ(config.source_id, "a=b");

	config.HandleSet("probe_size=512");
	EXPECT_EQ(config.probe_size, 512u);

	config.HandleSet("curl_timeout=5");
	EXPECT_EQ(config.curl_timeout, std::chrono::seconds(5));

	config.HandleSet("curl_verbose=yes");
	EXPECT_TRUE(config.curl_verbose);
}

TEST(Config, Invalid)
{
	StreamConfig config;

	EXPECT_THROW(config.HandleSet("block_size"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("block_size=0"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("block_size=-1"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("block_size=1x"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("curl_verbose=maybe"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("curl_timeout="), std::runtime_error);

	/* the previous values are kept */
	EXPECT_EQ(config.block_size, 1024u * 1024u);
}

TEST(Config, Unknown)
{
	StreamConfig config;

	try {
		config.HandleSet("foo=bar");
		FAIL();
	} catch (const std::runtime_error &e) {
		EXPECT_EQ(GetFullMessage(e),
			  "Error while parsing setting 'foo': Unknown variable");
	}
}
