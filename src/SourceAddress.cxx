// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SourceAddress.hxx"
#include "Error.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

SourceAddress
SourceAddress::Parse(std::string_view s)
{
	if (s.starts_with("http://"sv) || s.starts_with("https://"sv))
		return {Type::REMOTE, s};

	if (s.starts_with("file://"sv)) {
		s.remove_prefix(7);
		return {Type::LOCAL, s};
	}

	if (s.find("://"sv) != s.npos)
		throw UnsupportedSourceType(fmt::format("Unsupported URL scheme: '{}'",
							s));

	return {Type::LOCAL, s};
}

void
SourceAddress::Check() const
{
	switch (type) {
	case Type::NONE:
		break;

	case Type::LOCAL:
	case Type::REMOTE:
		if (location.empty())
			throw UnsupportedSourceType("Empty resource location");
		return;
	}

	throw UnsupportedSourceType("Undefined resource address");
}
