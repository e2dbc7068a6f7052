// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "UniqueFd.hxx"

#include <fcntl.h>

UniqueFd
UniqueFd::OpenReadOnly(const char *path) noexcept
{
	return UniqueFd{open(path, O_RDONLY|O_NOCTTY|O_CLOEXEC)};
}
