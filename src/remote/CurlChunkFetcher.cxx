// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CurlChunkFetcher.hxx"
#include "ChunkResponse.hxx"
#include "io/Logger.hxx"
#include "util/NumberParser.hxx"
#include "Error.hxx"
#include "version.h"

#include <fmt/core.h>

#include <span>

#include <strings.h>

using std::string_view_literals::operator""sv;

static constexpr LLogger logger{"curl"};

static bool
StartsWithIgnoreCase(std::string_view s, std::string_view prefix) noexcept
{
	return s.size() >= prefix.size() &&
		strncasecmp(s.data(), prefix.data(), prefix.size()) == 0;
}

static constexpr std::string_view
Strip(std::string_view s) noexcept
{
	while (!s.empty() && s.front() == ' ')
		s.remove_prefix(1);
	return s;
}

CurlChunkFetcher::CurlChunkFetcher(const char *_url,
				   std::chrono::seconds timeout, bool verbose)
	:url(_url), easy(_url)
{
	easy.SetNoSignal();
	easy.SetFollowLocation();
	easy.SetOption(CURLOPT_USERAGENT, "ranged-stream/" RANGED_STREAM_VERSION);
	easy.SetOption(CURLOPT_TIMEOUT, long(timeout.count()));
	easy.SetOption(CURLOPT_VERBOSE, long(verbose));
	easy.SetHeaderFunction(HeaderFunction, this);
	easy.SetWriteFunction(WriteFunction, this);
}

inline void
CurlChunkFetcher::OnHeader(std::string_view line) noexcept
{
	while (!line.empty() &&
	       (line.back() == '\n' || line.back() == '\r' || line.back() == ' '))
		line.remove_suffix(1);

	if (line.starts_with("HTTP/"sv)) {
		/* a new response (e.g. after a redirect) */
		content_range.clear();
		content_length.reset();
		return;
	}

	if (StartsWithIgnoreCase(line, "content-range:"sv))
		content_range = line.substr(14);
	else if (StartsWithIgnoreCase(line, "content-length:"sv))
		content_length = ParseDecimal(Strip(line.substr(15)));
}

inline std::size_t
CurlChunkFetcher::OnData(std::span<const std::byte> src) noexcept
{
	body.insert(body.end(), src.begin(), src.end());

	if (body.size() >= want_bytes && easy.GetResponseCode() == 200) {
		/* the server ignores our "Range" header and sends the
		   whole resource; we have enough */
		aborted = true;
		return 0;
	}

	return src.size();
}

std::size_t
CurlChunkFetcher::HeaderFunction(char *ptr, std::size_t size,
				 std::size_t nmemb, void *userdata) noexcept
{
	auto &fetcher = *(CurlChunkFetcher *)userdata;
	fetcher.OnHeader({ptr, size * nmemb});
	return size * nmemb;
}

std::size_t
CurlChunkFetcher::WriteFunction(char *ptr, std::size_t size,
				std::size_t nmemb, void *userdata) noexcept
{
	auto &fetcher = *(CurlChunkFetcher *)userdata;
	return fetcher.OnData({(const std::byte *)ptr, size * nmemb});
}

FetchedChunk
CurlChunkFetcher::Fetch(uint64_t offset, uint64_t length)
{
	body.clear();
	content_range.clear();
	content_length.reset();
	want_bytes = offset + length;
	aborted = false;

	const auto range = fmt::format("{}-{}", offset, offset + length - 1);
	easy.SetOption(CURLOPT_RANGE, range.c_str());

	logger.Fmt(5, "GET '{}' range={}", url, range);

	const CURLcode code = easy.Perform();
	if (code != CURLE_OK && !(code == CURLE_WRITE_ERROR && aborted)) {
		try {
			throw MakeCurlError(code, "CURL error");
		} catch (...) {
			std::throw_with_nested(SourceUnavailable(fmt::format("Failed to fetch '{}'",
									     url)));
		}
	}

	try {
		return InterpretChunkResponse({
				.status = unsigned(easy.GetResponseCode()),
				.content_range = content_range,
				.content_length = content_length,
				.body = std::move(body),
				.aborted = aborted,
			}, offset, length);
	} catch (...) {
		std::throw_with_nested(SourceUnavailable(fmt::format("Failed to fetch '{}'",
								     url)));
	}
}
