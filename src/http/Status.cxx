// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Status.hxx"

const char *
http_status_to_string(HttpStatus status) noexcept
{
	switch (status) {
	case HttpStatus::OK:
		return "200 OK";

	case HttpStatus::PARTIAL_CONTENT:
		return "206 Partial Content";

	case HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE:
		return "416 Requested Range Not Satisfiable";
	}

	return nullptr;
}
