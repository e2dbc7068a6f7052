// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "util/NumberParser.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <string.h>

using std::string_view_literals::operator""sv;

void
StreamConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "block_size"sv) {
		block_size = ParsePositiveSize(value);
	} else if (name == "max_content_size"sv) {
		max_content_size = ParseSize(value);
	} else if (name == "source_id"sv) {
		source_id = value;
	} else if (name == "probe_size"sv) {
		probe_size = ParsePositiveSize(value);
	} else if (name == "curl_timeout"sv) {
		curl_timeout = std::chrono::seconds(ParseUnsignedLong(value));
	} else if (name == "curl_verbose"sv) {
		curl_verbose = ParseBool(value);
	} else
		throw std::runtime_error("Unknown variable");
}

void
StreamConfig::HandleSet(const char *s)
{
	const char *eq = strchr(s, '=');
	if (eq == nullptr)
		throw std::runtime_error("'=' missing in setting");

	const std::string_view name{s, std::size_t(eq - s)};

	try {
		HandleSet(name, eq + 1);
	} catch (...) {
		std::throw_with_nested(std::runtime_error(fmt::format("Error while parsing setting '{}'",
								      name)));
	}
}
