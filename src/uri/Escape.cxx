// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Escape.hxx"

#include <algorithm>

static constexpr bool
IsUriUnreserved(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') ||
		ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

void
uri_escape_append(std::string &dest, std::string_view src, char escape_char)
{
	static constexpr char hex_digits[] = "0123456789ABCDEF";

	for (const char ch : src) {
		if (IsUriUnreserved(ch)) {
			dest.push_back(ch);
		} else {
			const auto byte = static_cast<unsigned char>(ch);
			dest.push_back(escape_char);
			dest.push_back(hex_digits[byte >> 4]);
			dest.push_back(hex_digits[byte & 0xf]);
		}
	}
}

static constexpr int
parse_hexdigit(char ch) noexcept
{
	if (ch >= '0' && ch <= '9')
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

char *
uri_unescape(char *dest, std::string_view src, char escape_char) noexcept
{
	auto i = src.begin();
	const auto end = src.end();

	while (true) {
		auto p = std::find(i, end, escape_char);
		dest = std::copy(i, p, dest);

		if (p == end)
			break;

		if (end - p < 3)
			/* percent sign at the end of string */
			return nullptr;

		const int digit1 = parse_hexdigit(p[1]);
		const int digit2 = parse_hexdigit(p[2]);
		if (digit1 == -1 || digit2 == -1)
			/* invalid hex digits */
			return nullptr;

		const char ch = (char)((digit1 << 4) | digit2);
		if (ch == 0)
			/* no %00 hack allowed! */
			return nullptr;

		*dest++ = ch;
		i = p + 3;
	}

	return dest;
}
