// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

/**
 * Initialize libcurl for the lifetime of this object; there should
 * be exactly one instance in main().
 */
class ScopeCurlInit {
public:
	/**
	 * Throws std::runtime_error on error.
	 */
	ScopeCurlInit();
	~ScopeCurlInit() noexcept;

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};
