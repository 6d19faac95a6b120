// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HTML.hxx"

std::size_t
html_escape_size(std::string_view p) noexcept
{
	std::size_t size = 0;
	for (const char ch : p) {
		switch (ch) {
		case '&':
			size += 5;
			break;

		case '"':
		case '\'':
			size += 6;
			break;

		case '<':
		case '>':
			size += 4;
			break;

		default:
			++size;
		}
	}

	return size;
}

void
html_escape_append(std::string &dest, std::string_view p)
{
	dest.reserve(dest.size() + html_escape_size(p));

	for (const char ch : p) {
		switch (ch) {
		case '&':
			dest.append("&amp;");
			break;

		case '"':
			dest.append("&quot;");
			break;

		case '\'':
			dest.append("&apos;");
			break;

		case '<':
			dest.append("&lt;");
			break;

		case '>':
			dest.append("&gt;");
			break;

		default:
			dest.push_back(ch);
		}
	}
}

std::string
html_escape(std::string_view p)
{
	std::string result;
	html_escape_append(result, p);
	return result;
}
