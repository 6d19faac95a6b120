// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <map>
#include <string>
#include <string_view>

/**
 * A case-insensitive map of request headers.  Names are stored in
 * lower case; repeated headers are combined into one
 * comma-separated value (RFC 7230 3.2.2).
 */
class HeaderMap {
	std::map<std::string, std::string, std::less<>> map;

public:
	bool empty() const noexcept {
		return map.empty();
	}

	void Add(std::string_view name, std::string_view value);

	/**
	 * @param name the lower-case header name
	 * @return the value or nullptr if the header is not present
	 */
	[[gnu::pure]]
	const char *Get(std::string_view name) const noexcept;
};
