// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ContentRange.hxx"
#include "util/NumberParser.hxx"

using std::string_view_literals::operator""sv;

std::optional<ContentRange>
ParseContentRange(std::string_view s) noexcept
{
	while (!s.empty() && s.front() == ' ')
		s.remove_prefix(1);
	while (!s.empty() && s.back() == ' ')
		s.remove_suffix(1);

	if (!s.starts_with("bytes "sv))
		return std::nullopt;

	s.remove_prefix(6);

	const auto slash = s.find('/');
	if (slash == s.npos)
		return std::nullopt;

	const auto range = s.substr(0, slash);
	const auto length = s.substr(slash + 1);

	ContentRange result;

	if (length != "*"sv) {
		result.complete_length = ParseDecimal(length);
		if (!result.complete_length)
			return std::nullopt;
	}

	if (range == "*"sv) {
		/* unsatisfied-range requires the complete length */
		if (!result.complete_length)
			return std::nullopt;

		return result;
	}

	const auto dash = range.find('-');
	if (dash == range.npos)
		return std::nullopt;

	const auto first = ParseDecimal(range.substr(0, dash));
	const auto last = ParseDecimal(range.substr(dash + 1));
	if (!first || !last || *last < *first)
		return std::nullopt;

	if (result.complete_length && *last >= *result.complete_length)
		return std::nullopt;

	result.satisfied = true;
	result.first = *first;
	result.last = *last;
	return result;
}
