// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * An ordered list of response headers to be passed to the HTTP
 * server.  Names are lower case.
 */
class HttpHeaderList {
	using Item = std::pair<std::string, std::string>;
	std::vector<Item> items;

public:
	void Add(std::string_view name, std::string_view value) {
		items.emplace_back(name, value);
	}

	/**
	 * @return the value of the first header with the given name
	 * or nullptr
	 */
	[[gnu::pure]]
	const char *Get(std::string_view name) const noexcept {
		for (const auto &i : items)
			if (i.first == name)
				return i.second.c_str();
		return nullptr;
	}

	bool empty() const noexcept {
		return items.empty();
	}

	auto size() const noexcept {
		return items.size();
	}

	auto begin() const noexcept {
		return items.begin();
	}

	auto end() const noexcept {
		return items.end();
	}
};
