// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <utility>

/**
 * Build an exception for a CURLcode.
 */
std::runtime_error
MakeCurlError(CURLcode code, const char *prefix);

/**
 * An OO wrapper for a "CURL*" (a libcurl "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws std::runtime_error on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::runtime_error("curl_easy_init() failed");
	}

	explicit CurlEasy(const char *url)
		:CurlEasy()
	{
		SetURL(url);
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw MakeCurlError(code, "Failed to set option");
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetNoSignal() {
		SetOption(CURLOPT_NOSIGNAL, 1L);
	}

	void SetFollowLocation(bool value=true) {
		SetOption(CURLOPT_FOLLOWLOCATION, long(value));
	}

	void SetHeaderFunction(size_t (*function)(char *buffer, size_t size,
						  size_t nitems,
						  void *userdata),
			       void *userdata) {
		SetOption(CURLOPT_HEADERFUNCTION, function);
		SetOption(CURLOPT_HEADERDATA, userdata);
	}

	void SetWriteFunction(size_t (*function)(char *ptr, size_t size,
						 size_t nmemb, void *userdata),
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	/**
	 * Returns CURLE_OK or the error code; does not throw.
	 */
	CURLcode Perform() noexcept {
		return curl_easy_perform(handle);
	}

	long GetResponseCode() const noexcept {
		long status = 0;
		curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
		return status;
	}
};
