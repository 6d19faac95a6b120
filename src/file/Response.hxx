// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Transport-independent description of a static file response.
 */

#pragma once

#include "http/Status.hxx"
#include "http/Method.hxx"
#include "io/UniqueFd.hxx"

#include <map>
#include <string>
#include <string_view>
#include <variant>

#include <sys/types.h>

struct ResolvedEntity;
struct Validators;
class MimeTypeTable;
enum class ConditionalOutcome : uint_least8_t;

/**
 * A response body which is read from an open regular file.
 */
struct FileBody {
	UniqueFd fd;

	/**
	 * The number of bytes to be sent, starting at offset 0.
	 */
	off_t size;
};

/**
 * No body, a materialized body or a file.
 */
using ResponseBody = std::variant<std::monostate, std::string, FileBody>;

using ResponseHeaders = std::map<std::string, std::string, std::less<>>;

struct StaticResponse {
	HttpStatus status;

	ResponseHeaders headers;

	ResponseBody body;

	explicit StaticResponse(HttpStatus _status) noexcept
		:status(_status) {}

	/**
	 * @return the header value or nullptr if the header was not
	 * set
	 */
	[[gnu::pure]]
	const char *GetHeader(std::string_view name) const noexcept {
		auto i = headers.find(name);
		return i != headers.end() ? i->second.c_str() : nullptr;
	}

	bool HasBody() const noexcept {
		return !std::holds_alternative<std::monostate>(body);
	}
};

/**
 * Build a response without body and without validators, e.g. 404
 * or 500.
 */
StaticResponse
BuildErrorResponse(HttpStatus status) noexcept;

/**
 * Build the response for a resolved file or directory.  The body
 * is omitted for HEAD requests and for all outcomes other than
 * #ConditionalOutcome::FULL.
 *
 * @param entity the file or directory; its descriptor is moved into
 * the response body
 * @param listing the rendered directory listing (only used for
 * directories)
 */
StaticResponse
BuildResponse(HttpMethod method, ResolvedEntity &&entity,
	      ConditionalOutcome outcome, const Validators &validators,
	      std::string &&listing, const MimeTypeTable &mime_types);
