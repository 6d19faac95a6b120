// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Entity tag lists as found in the "If-Match" and "If-None-Match"
 * request headers.
 */

#pragma once

#include <string_view>

/**
 * Is this list header value the wildcard "*"?
 */
[[gnu::pure]]
bool
http_list_is_wildcard(std::string_view list) noexcept;

/**
 * Compare two entity tags using the weak comparison function (RFC
 * 7232 2.3.2): the "W/" prefix is ignored on both sides.  Unquoted
 * tags (sent by sloppy clients) are compared with the quotes of the
 * other side removed.
 */
[[gnu::pure]]
bool
http_etag_weak_equals(std::string_view a, std::string_view b) noexcept;

/**
 * Does the comma-separated entity tag list contain the given tag
 * (weak comparison)?  A "*" item matches everything.
 */
[[gnu::pure]]
bool
http_list_contains_etag(std::string_view list, std::string_view etag) noexcept;
