// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Range.hxx"
#include "util/NumberParser.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t';
}

static constexpr std::string_view
Strip(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespace(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && IsWhitespace(s.back()))
		s.remove_suffix(1);
	return s;
}

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch;
}

static constexpr bool
EqualsIgnoreCaseASCII(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(),
			   [](char x, char y){
				   return ToLowerASCII(x) == ToLowerASCII(y);
			   });
}

/**
 * Split "bytes=..." and return the range set after the '='.
 */
static std::optional<std::string_view>
SplitByteRangeSet(std::string_view header) noexcept
{
	const auto eq = header.find('=');
	if (eq == header.npos)
		return std::nullopt;

	if (!EqualsIgnoreCaseASCII(Strip(header.substr(0, eq)), "bytes"sv))
		return std::nullopt;

	return header.substr(eq + 1);
}

namespace {

/**
 * One syntactically valid "first-last", "first-" or "-suffix" range.
 */
struct RangeSpec {
	std::optional<uint64_t> first, last;

	constexpr bool IsSuffix() const noexcept {
		return !first;
	}
};

}

/* the inclusive end is converted to an exclusive one, therefore one
   less than the int64_t maximum */
static constexpr uint64_t max_position = INT64_MAX - 1;

static std::optional<RangeSpec>
ParseRangeSpec(std::string_view s) noexcept
{
	s = Strip(s);

	const auto dash = s.find('-');
	if (dash == s.npos)
		return std::nullopt;

	const auto first_string = Strip(s.substr(0, dash));
	const auto last_string = Strip(s.substr(dash + 1));

	RangeSpec spec;

	if (!first_string.empty()) {
		spec.first = ParseDecimal(first_string, max_position);
		if (!spec.first)
			return std::nullopt;
	}

	if (!last_string.empty()) {
		spec.last = ParseDecimal(last_string, max_position);
		if (!spec.last)
			return std::nullopt;
	}

	if (spec.first) {
		if (spec.last && *spec.last < *spec.first)
			/* inverted */
			return std::nullopt;
	} else {
		/* suffix-byte-range-spec needs a positive length */
		if (!spec.last || *spec.last == 0)
			return std::nullopt;
	}

	return spec;
}

/**
 * Parse all ranges of a range set and return the first one.  We
 * don't handle multipart byteranges: the others are only checked.
 */
static std::optional<RangeSpec>
ParseFirstRangeSpec(std::string_view set) noexcept
{
	std::optional<RangeSpec> first;

	while (true) {
		const auto comma = set.find(',');
		const auto spec = ParseRangeSpec(set.substr(0, comma));
		if (!spec)
			return std::nullopt;

		if (!first)
			first = spec;

		if (comma == set.npos)
			break;

		set = set.substr(comma + 1);
	}

	return first;
}

std::optional<DeferredRange>
ParseDeferredRangeHeader(std::string_view header) noexcept
{
	auto set = SplitByteRangeSet(header);
	if (!set)
		return std::nullopt;

	const auto spec = ParseFirstRangeSpec(*set);
	if (!spec)
		return std::nullopt;

	DeferredRange range;

	if (spec->IsSuffix()) {
		/* the last N bytes, but we don't know the size yet;
		   a negative start is the marker */
		range.start = -int64_t(*spec->last);
	} else {
		range.start = int64_t(*spec->first);
		if (spec->last)
			range.stop = *spec->last + 1;
	}

	return range;
}

std::optional<ByteRange>
ParseRangeHeader(std::string_view header, uint64_t size) noexcept
{
	const auto range = ParseDeferredRangeHeader(header);
	if (!range)
		return std::nullopt;

	return range->Resolve(size);
}
