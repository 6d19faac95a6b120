// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Measure the size of the escaped string.
 */
[[gnu::pure]]
std::size_t
html_escape_size(std::string_view p) noexcept;

/**
 * Append the string to #dest, escaping the HTML special characters
 * (ampersand, quotes, angle brackets).
 */
void
html_escape_append(std::string &dest, std::string_view p);

std::string
html_escape(std::string_view p);
