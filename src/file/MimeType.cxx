// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MimeType.hxx"
#include "beng-static/Headers.hxx"

#include <algorithm>
#include <stdexcept>

static constexpr struct {
	std::string_view extension;
	const char *type;
} builtin_mime_types[] = {
	{"avif", "image/avif"},
	{"bmp", "image/bmp"},
	{"css", "text/css"},
	{"csv", "text/csv"},
	{"gif", "image/gif"},
	{"gz", "application/gzip"},
	{"htm", "text/html"},
	{"html", "text/html"},
	{"ico", "image/vnd.microsoft.icon"},
	{"jpeg", "image/jpeg"},
	{"jpg", "image/jpeg"},
	{"js", "text/javascript"},
	{"json", "application/json"},
	{"md", "text/markdown"},
	{"mjs", "text/javascript"},
	{"mp3", "audio/mpeg"},
	{"mp4", "video/mp4"},
	{"ogg", "audio/ogg"},
	{"otf", "font/otf"},
	{"pdf", "application/pdf"},
	{"png", "image/png"},
	{"svg", "image/svg+xml"},
	{"tar", "application/x-tar"},
	{"ttf", "font/ttf"},
	{"txt", "text/plain"},
	{"wasm", "application/wasm"},
	{"wav", "audio/wav"},
	{"webm", "video/webm"},
	{"webp", "image/webp"},
	{"woff", "font/woff"},
	{"woff2", "font/woff2"},
	{"xml", "application/xml"},
	{"zip", "application/zip"},
};

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch;
}

static std::string
ToLowerASCII(std::string_view s)
{
	std::string result;
	result.reserve(s.size());
	for (char ch : s)
		result.push_back(ToLowerASCII(ch));
	return result;
}

[[gnu::pure]]
static bool
EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(),
			   [](char x, char y){
				   return ToLowerASCII(x) == ToLowerASCII(y);
			   });
}

const char *
LookupBuiltinMimeType(std::string_view extension) noexcept
{
	for (const auto &i : builtin_mime_types)
		if (EqualsIgnoreCase(i.extension, extension))
			return i.type;

	return nullptr;
}

/**
 * Extract the extension (without dot) from the last segment of a
 * path.  Hidden files without another dot (".profile") have no
 * extension.
 */
[[gnu::pure]]
static std::string_view
GetExtension(std::string_view path) noexcept
{
	if (const auto slash = path.rfind('/'); slash != path.npos)
		path = path.substr(slash + 1);

	const auto dot = path.rfind('.');
	if (dot == path.npos || dot == 0)
		return {};

	return path.substr(dot + 1);
}

[[gnu::pure]]
static bool
IsValidExtension(std::string_view extension) noexcept
{
	return !extension.empty() &&
		extension.find_first_of("./") == extension.npos;
}

[[gnu::pure]]
static bool
IsValidMimeType(std::string_view type) noexcept
{
	const auto slash = type.find('/');
	return slash != type.npos && slash > 0 && slash + 1 < type.size() &&
		type.front() != ' ' && type.back() != ' ' &&
		std::none_of(type.begin(), type.end(), [](char ch){
			return (unsigned char)ch < 0x20 || ch == 0x7f;
		});
}

void
MimeTypeTable::Set(std::string_view extension, std::string_view type)
{
	if (!IsValidExtension(extension))
		throw std::invalid_argument{"Malformed file name extension"};

	if (!IsValidMimeType(type))
		throw std::invalid_argument{"Malformed MIME type"};

	overrides.insert_or_assign(ToLowerASCII(extension), std::string{type});
}

std::string_view
MimeTypeTable::Lookup(std::string_view path) const
{
	const auto extension = GetExtension(path);
	if (extension.empty())
		return BengStatic::DEFAULT_CONTENT_TYPE;

	if (!overrides.empty()) {
		if (auto i = overrides.find(ToLowerASCII(extension));
		    i != overrides.end())
			return i->second;
	}

	if (const char *type = LookupBuiltinMimeType(extension))
		return type;

	return BengStatic::DEFAULT_CONTENT_TYPE;
}
