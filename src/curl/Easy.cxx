// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Easy.hxx"

#include <fmt/core.h>

std::runtime_error
MakeCurlError(CURLcode code, const char *prefix)
{
	return std::runtime_error(fmt::format("{}: {}", prefix,
					      curl_easy_strerror(code)));
}
