// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Response.hxx"
#include "http/Method.hxx"
#include "http/HeaderMap.hxx"

#include <string>

struct StaticConfig;

struct StaticRequest {
	HttpMethod method;

	/**
	 * The URI path as received (percent-encoded, without query
	 * string).
	 */
	std::string uri;

	HeaderMap headers;
};

/**
 * Handle one GET or HEAD request: resolve the path, compute the
 * validators, evaluate the conditional request headers and build
 * the response.  I/O errors are logged and answered with "500
 * Internal Server Error".
 */
StaticResponse
HandleStaticRequest(const StaticConfig &config,
		    const StaticRequest &request) noexcept;
