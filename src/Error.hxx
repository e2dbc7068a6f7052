// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

/**
 * The resource could not be read: the local file failed or a remote
 * fetch failed.  This is fatal for the response; bytes which have
 * already been streamed cannot be revoked.
 */
class SourceUnavailable : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The resource is neither a local file nor a remote blob this
 * library knows how to read.  Thrown before any byte is sent.
 */
class UnsupportedSourceType : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * Throw a #SourceUnavailable with the given message and the errno
 * value as nested std::system_error.
 */
[[noreturn]]
void
ThrowSourceErrno(int e, const std::string &msg);

/**
 * Build a message from the exception and all of its nested causes,
 * separated by ": ".
 */
std::string
GetFullMessage(const std::exception &e) noexcept;

std::string
GetFullMessage(std::exception_ptr ep) noexcept;
