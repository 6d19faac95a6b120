// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

enum class HttpStatus : uint_least16_t {
	OK = 200,
	NOT_MODIFIED = 304,
	BAD_REQUEST = 400,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	PRECONDITION_FAILED = 412,
	INTERNAL_SERVER_ERROR = 500,
};

constexpr const char *
http_status_to_string(HttpStatus status) noexcept
{
	switch (status) {
	case HttpStatus::OK:
		return "OK";

	case HttpStatus::NOT_MODIFIED:
		return "Not Modified";

	case HttpStatus::BAD_REQUEST:
		return "Bad Request";

	case HttpStatus::NOT_FOUND:
		return "Not Found";

	case HttpStatus::METHOD_NOT_ALLOWED:
		return "Method Not Allowed";

	case HttpStatus::PRECONDITION_FAILED:
		return "Precondition Failed";

	case HttpStatus::INTERNAL_SERVER_ERROR:
		return "Internal Server Error";
	}

	return "Unknown";
}
