// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"
#include "Error.hxx"

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

unsigned
GetLogLevel() noexcept
{
	return log_level;
}

namespace LoggerDetail {

void
AppendParam(fmt::memory_buffer &buffer, std::string_view s) noexcept
{
	buffer.append(s.data(), s.data() + s.size());
}

void
AppendParam(fmt::memory_buffer &buffer, const std::exception &e) noexcept
{
	AppendParam(buffer, GetFullMessage(e));
}

void
AppendParam(fmt::memory_buffer &buffer, std::exception_ptr ep) noexcept
{
	AppendParam(buffer, GetFullMessage(std::move(ep)));
}

void
WriteLine(std::string_view domain, std::string_view msg) noexcept
{
	fmt::memory_buffer line;
	if (!domain.empty()) {
		line.push_back('[');
		line.append(domain.data(), domain.data() + domain.size());
		line.push_back(']');
		line.push_back(' ');
	}

	line.append(msg.data(), msg.data() + msg.size());
	line.push_back('\n');

	fwrite(line.data(), 1, line.size(), stderr);
}

void
VFmt(std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	WriteLine(domain, {buffer.data(), buffer.size()});
}

} // namespace LoggerDetail
