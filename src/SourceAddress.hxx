// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * Describes where the resource is: a local file or a remote blob.
 */
struct SourceAddress {
	enum class Type : uint_least8_t {
		NONE,

		/**
		 * A path on the local filesystem.
		 */
		LOCAL,

		/**
		 * An "http://" or "https://" URL.
		 */
		REMOTE,
	};

	Type type = Type::NONE;

	/**
	 * The path (#Type::LOCAL) or the URL (#Type::REMOTE).
	 */
	std::string location;

	SourceAddress() noexcept = default;

	SourceAddress(Type _type, std::string_view _location)
		:type(_type), location(_location) {}

	/**
	 * Classify a command line argument: "http://" and
	 * "https://" URLs are remote, "file://" URLs and everything
	 * without a URL scheme is local.
	 *
	 * Throws #UnsupportedSourceType on an unknown URL scheme.
	 */
	static SourceAddress Parse(std::string_view s);

	constexpr bool IsDefined() const noexcept {
		return type != Type::NONE;
	}

	/**
	 * Throws #UnsupportedSourceType if this address cannot be
	 * read.
	 */
	void Check() const;
};
