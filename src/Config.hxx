// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include <stdint.h>

/**
 * Configuration of the streaming layer.
 */
struct StreamConfig {
	/**
	 * The maximum size of one block (and of one network chunk).
	 */
	std::size_t block_size = 1024 * 1024;

	/**
	 * Never return more than this number of bytes in one
	 * partial response; clients need to ask again with an
	 * advanced start offset.  0 means unlimited.
	 */
	uint64_t max_content_size = 0;

	/**
	 * An opaque identifier copied to each #ChunkEvent.
	 */
	std::string source_id;

	/**
	 * The size of the probe request which discovers the size of
	 * a remote resource for a suffix range.
	 */
	std::size_t probe_size = 1024;

	/**
	 * The timeout of each remote chunk request.
	 */
	std::chrono::seconds curl_timeout = std::chrono::minutes(1);

	bool curl_verbose = false;

	/**
	 * Handle one "NAME=VALUE" setting.
	 *
	 * Throws std::runtime_error on error.
	 */
	void HandleSet(std::string_view name, const char *value);

	/**
	 * Split "NAME=VALUE" and call HandleSet().
	 *
	 * Throws std::runtime_error on error.
	 */
	void HandleSet(const char *s);
};
