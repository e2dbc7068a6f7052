// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string_view>

#include <stdint.h>

/**
 * Parse a non-empty string of decimal digits.  Signs, whitespace and
 * values above #max are rejected.
 */
[[gnu::pure]]
std::optional<uint64_t>
ParseDecimal(std::string_view s, uint64_t max=INT64_MAX) noexcept;

/**
 * Parse a byte count with an optional "k", "M" or "G" suffix (binary
 * multiples).
 *
 * Throws std::runtime_error on error.
 */
uint64_t
ParseSize(const char *s);

/**
 * Like ParseSize(), but zero is rejected.
 */
uint64_t
ParsePositiveSize(const char *s);

/**
 * Throws std::runtime_error on error.
 */
unsigned long
ParseUnsignedLong(const char *s);

/**
 * Accepts "yes" and "no".
 *
 * Throws std::runtime_error on error.
 */
bool
ParseBool(const char *s);
