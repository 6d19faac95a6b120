// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Names of the HTTP headers consumed and produced by beng-static.
 */

#pragma once

#include <string_view>

namespace BengStatic {

/*
 * Request headers.  Lookups in a request header map are done with
 * lower-case names.
 */

constexpr std::string_view IF_MATCH_HEADER = "if-match";
constexpr std::string_view IF_NONE_MATCH_HEADER = "if-none-match";
constexpr std::string_view IF_MODIFIED_SINCE_HEADER = "if-modified-since";
constexpr std::string_view IF_UNMODIFIED_SINCE_HEADER = "if-unmodified-since";

/*
 * Response headers.
 */

constexpr std::string_view CONTENT_LENGTH_HEADER = "Content-Length";
constexpr std::string_view CONTENT_TYPE_HEADER = "Content-Type";
constexpr std::string_view ETAG_HEADER = "ETag";
constexpr std::string_view LAST_MODIFIED_HEADER = "Last-Modified";
constexpr std::string_view SERVER_HEADER = "Server";
constexpr std::string_view ALLOW_HEADER = "Allow";

/**
 * The content type of generated directory listings.
 */
constexpr std::string_view DIRECTORY_LISTING_CONTENT_TYPE = "text/html";

/**
 * The content type for files without a known extension.
 */
constexpr std::string_view DEFAULT_CONTENT_TYPE = "application/octet-stream";

} // namespace BengStatic
