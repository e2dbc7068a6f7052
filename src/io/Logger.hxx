// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string_view>
#include <type_traits>

/**
 * Change the global verbosity.  Messages with a level above this
 * are discarded.  The default is 1 (errors only).
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
static inline bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

namespace LoggerDetail {

void
AppendParam(fmt::memory_buffer &buffer, std::string_view s) noexcept;

void
AppendParam(fmt::memory_buffer &buffer, const std::exception &e) noexcept;

void
AppendParam(fmt::memory_buffer &buffer, std::exception_ptr ep) noexcept;

template<typename T>
requires std::is_arithmetic_v<T>
void
AppendParam(fmt::memory_buffer &buffer, T value) noexcept
{
	fmt::format_to(std::back_inserter(buffer), "{}", value);
}

void
WriteLine(std::string_view domain, std::string_view msg) noexcept;

void
VFmt(std::string_view domain,
     fmt::string_view format_str, fmt::format_args args) noexcept;

} // namespace LoggerDetail

/**
 * Concatenate all parameters to one log line.
 */
template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain,
	  Params &&... params) noexcept
{
	if (!CheckLogLevel(level))
		return;

	fmt::memory_buffer buffer;
	(LoggerDetail::AppendParam(buffer, std::forward<Params>(params)), ...);
	LoggerDetail::WriteLine(domain, {buffer.data(), buffer.size()});
}

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args &&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	LoggerDetail::VFmt(domain, format_str,
			   fmt::make_format_args(args...));
}

/**
 * A logger with a fixed domain which is prepended to each line.
 */
class LLogger {
	std::string_view domain;

public:
	explicit constexpr LLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	std::string_view GetDomain() const noexcept {
		return domain;
	}

	template<typename... Params>
	void operator()(unsigned level, Params &&... params) const noexcept {
		LogConcat(level, domain, std::forward<Params>(params)...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args &&... args) const noexcept {
		LogFmt(level, domain, format_str, std::forward<Args>(args)...);
	}
};
