// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * The request methods understood by the static file handler.
 */
enum class HttpMethod : uint_least8_t {
	HEAD,
	GET,
};

constexpr const char *
http_method_to_string(HttpMethod method) noexcept
{
	switch (method) {
	case HttpMethod::HEAD:
		return "HEAD";

	case HttpMethod::GET:
		return "GET";
	}

	return "?";
}
