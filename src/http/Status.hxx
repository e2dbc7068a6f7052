// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>

enum class HttpStatus : uint_least16_t {
	OK = 200,
	PARTIAL_CONTENT = 206,
	REQUESTED_RANGE_NOT_SATISFIABLE = 416,
};

[[gnu::const]]
const char *
http_status_to_string(HttpStatus status) noexcept;
