// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Format and parse HTTP dates.
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

/**
 * The size of a buffer for http_date_format_r(), including the null
 * terminator.
 */
constexpr std::size_t HTTP_DATE_BUFFER_SIZE = 30;

/**
 * Format a time stamp in the IMF-fixdate format (RFC 7231 7.1.1.1),
 * e.g. "Sun, 06 Nov 1994 08:49:37 GMT".  Sub-second precision is
 * discarded.
 */
void
http_date_format_r(char *buffer, std::chrono::system_clock::time_point t) noexcept;

std::string
http_date_format(std::chrono::system_clock::time_point t);

/**
 * Parse an IMF-fixdate string.
 *
 * @return the time stamp or std::chrono::system_clock::from_time_t(-1)
 * if the string is malformed
 */
[[gnu::pure]]
std::chrono::system_clock::time_point
http_date_parse(std::string_view p) noexcept;
