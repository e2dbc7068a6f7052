// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string_view>

#include <stdint.h>

/**
 * A parsed "Content-Range" response header.
 */
struct ContentRange {
	/**
	 * False for an unsatisfied range, i.e. an asterisk instead of
	 * FIRST-LAST (sent with status 416).
	 */
	bool satisfied = false;

	/**
	 * First and last byte (both inclusive); only valid if
	 * #satisfied is true.
	 */
	uint64_t first = 0, last = 0;

	/**
	 * The size of the whole resource; unset if the server sent
	 * "*".
	 */
	std::optional<uint64_t> complete_length;
};

/**
 * Parse "bytes FIRST-LAST/LENGTH".  Either FIRST-LAST (unsatisfied
 * range) or LENGTH (unknown size) may be an asterisk, but not both.
 *
 * @return std::nullopt on syntax error
 */
[[gnu::pure]]
std::optional<ContentRange>
ParseContentRange(std::string_view s) noexcept;
