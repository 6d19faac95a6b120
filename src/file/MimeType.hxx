// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <map>
#include <string>
#include <string_view>

/**
 * Maps file name extensions to MIME types.  Starts with a builtin
 * table; entries can be added or overridden during configuration.
 * Extensions are matched case-insensitively.
 */
class MimeTypeTable {
	/**
	 * Overrides, keyed by lower-case extension without the dot.
	 */
	std::map<std::string, std::string, std::less<>> overrides;

public:
	/**
	 * Add or replace an entry.
	 *
	 * Throws std::invalid_argument if the extension or the type
	 * is malformed.
	 */
	void Set(std::string_view extension, std::string_view type);

	/**
	 * Determine the content type of a file.  Only the last path
	 * segment is considered.
	 *
	 * @return the MIME type or "application/octet-stream" if the
	 * extension is missing or unknown
	 */
	std::string_view Lookup(std::string_view path) const;
};

/**
 * Look up an extension (without dot) in the builtin table.
 *
 * @return the MIME type or nullptr if the extension is unknown
 */
[[gnu::pure]]
const char *
LookupBuiltinMimeType(std::string_view extension) noexcept;
