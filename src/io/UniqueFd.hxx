// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <utility>

#include <unistd.h>

/**
 * Owns a file descriptor and closes it in the destructor.
 */
class UniqueFd {
	int fd = -1;

public:
	UniqueFd() noexcept = default;

	explicit constexpr UniqueFd(int _fd) noexcept
		:fd(_fd) {}

	UniqueFd(UniqueFd &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFd() noexcept {
		if (IsDefined())
			close(fd);
	}

	UniqueFd &operator=(UniqueFd &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	/**
	 * Open a file read-only.  Returns an undefined instance on
	 * error (with errno set).
	 */
	static UniqueFd OpenReadOnly(const char *path) noexcept;
};
