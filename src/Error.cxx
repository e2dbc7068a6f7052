// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"

#include <system_error>

void
ThrowSourceErrno(int e, const std::string &msg)
{
	try {
		throw std::system_error(e, std::system_category());
	} catch (...) {
		std::throw_with_nested(SourceUnavailable(msg));
	}
}

static void
AppendNested(std::string &result, const std::exception &e) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		result += ": ";
		result += nested.what();
		AppendNested(result, nested);
	} catch (...) {
		result += ": Unrecognized nested exception";
	}
}

std::string
GetFullMessage(const std::exception &e) noexcept
{
	std::string result = e.what();
	AppendNested(result, e);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return "Unrecognized exception";
	}
}
