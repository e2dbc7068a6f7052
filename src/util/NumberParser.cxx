// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "NumberParser.hxx"

#include <charconv>
#include <stdexcept>

#include <limits.h>
#include <string.h>

std::optional<uint64_t>
ParseDecimal(std::string_view s, uint64_t max) noexcept
{
	if (s.empty())
		return std::nullopt;

	uint64_t value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value, 10);
	if (ec != std::errc{} || ptr != s.data() + s.size() || value > max)
		return std::nullopt;

	return value;
}

uint64_t
ParseSize(const char *s)
{
	std::string_view v{s};

	uint64_t multiplier = 1;
	if (!v.empty()) {
		switch (v.back()) {
		case 'k':
			multiplier = 1024;
			v.remove_suffix(1);
			break;

		case 'M':
			multiplier = 1024 * 1024;
			v.remove_suffix(1);
			break;

		case 'G':
			multiplier = 1024 * 1024 * 1024;
			v.remove_suffix(1);
			break;
		}
	}

	const auto value = ParseDecimal(v, INT64_MAX / multiplier);
	if (!value)
		throw std::runtime_error("Failed to parse size");

	return *value * multiplier;
}

uint64_t
ParsePositiveSize(const char *s)
{
	const uint64_t value = ParseSize(s);
	if (value == 0)
		throw std::runtime_error("Value must be positive");

	return value;
}

unsigned long
ParseUnsignedLong(const char *s)
{
	const auto value = ParseDecimal(s, ULONG_MAX);
	if (!value)
		throw std::runtime_error("Failed to parse number");

	return *value;
}

bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0)
		return true;
	else if (strcmp(s, "no") == 0)
		return false;
	else
		throw std::runtime_error("Failed to parse boolean value (yes/no expected)");
}
