// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Init.hxx"
#include "Easy.hxx"

ScopeCurlInit::ScopeCurlInit()
{
	CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
	if (code != CURLE_OK)
		throw MakeCurlError(code, "CURL initialization failed");
}

ScopeCurlInit::~ScopeCurlInit() noexcept
{
	curl_global_cleanup();
}
