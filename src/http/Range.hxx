// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string_view>

#include <stdint.h>

/**
 * A half-open byte range [start, stop).
 */
struct ByteRange {
	uint64_t start, stop;

	constexpr uint64_t GetLength() const noexcept {
		return stop > start ? stop - start : 0;
	}

	constexpr bool operator==(const ByteRange &) const noexcept = default;
};

/**
 * Parse a "Range" request header against a resource of the given
 * size.  Only the first range of a multi-range header is used; the
 * others are verified but discarded.
 *
 * The result is not clamped: "bytes=1500-" on a 1000 byte resource
 * returns [1500, 1000), and the caller decides that this is not
 * satisfiable.
 *
 * @return std::nullopt if the header is malformed or uses another
 * unit than "bytes"
 */
[[gnu::pure]]
std::optional<ByteRange>
ParseRangeHeader(std::string_view header, uint64_t size) noexcept;

/**
 * A "Range" request header parsed without knowing the resource
 * size.  Call Resolve() as soon as the size is known.
 */
struct DeferredRange {
	/**
	 * The first byte.  A negative value means "the last -start
	 * bytes".
	 */
	int64_t start = 0;

	/**
	 * The end of the range (exclusive); 0 means "until the end of
	 * the resource".
	 */
	uint64_t stop = 0;

	constexpr bool IsSuffix() const noexcept {
		return start < 0;
	}

	constexpr uint64_t GetSuffixLength() const noexcept {
		return IsSuffix() ? uint64_t(-start) : 0;
	}

	constexpr bool HasStop() const noexcept {
		return stop > 0;
	}

	constexpr ByteRange Resolve(uint64_t size) const noexcept {
		if (IsSuffix()) {
			const uint64_t length = GetSuffixLength();
			return {length < size ? size - length : 0, size};
		}

		return {uint64_t(start), HasStop() ? stop : size};
	}
};

/**
 * Parse a "Range" request header for a resource whose size is not
 * yet known.  Like ParseRangeHeader(), only the first range is
 * used and the others are verified.
 *
 * @return std::nullopt if the header is malformed or uses another
 * unit than "bytes"
 */
[[gnu::pure]]
std::optional<DeferredRange>
ParseDeferredRangeHeader(std::string_view header) noexcept;
