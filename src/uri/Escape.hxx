// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of URI parts.
 */

#pragma once

#include <string>
#include <string_view>

/**
 * Append the string to #dest, replacing every character which is
 * not "unreserved" (RFC 3986 2.3) with a percent-encoded octet.
 */
void
uri_escape_append(std::string &dest, std::string_view src,
		  char escape_char='%');

/**
 * Decode percent-encoded octets into #dest (which must be at least
 * as large as #src).
 *
 * @return the end of the destination buffer, or nullptr if the
 * string is malformed or contains an encoded null byte
 */
char *
uri_unescape(char *dest, std::string_view src, char escape_char='%') noexcept;
