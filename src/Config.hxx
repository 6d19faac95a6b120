// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "file/Validators.hxx"
#include "file/MimeType.hxx"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * Configuration which determines the behaviour of the static file
 * server.  It is built once at startup and is immutable afterwards.
 */
struct StaticConfig {
	/**
	 * The directory which is served.  After Finish(), this is a
	 * canonical absolute path.
	 */
	std::string document_root = ".";

	/**
	 * The numeric address the HTTP listener is bound to.
	 */
	std::string listen_address = "0.0.0.0";

	uint_least16_t port = 8080;

	ETagPolicy etag_policy = ETagPolicy::STAT;

	/**
	 * Generate HTML listings for directories?  If disabled,
	 * directories are answered with "404 Not Found".
	 */
	bool directory_listing = true;

	MimeTypeTable mime_types;

	/**
	 * Handle one "--set NAME=VALUE" option.
	 *
	 * Throws std::runtime_error on error.
	 */
	void HandleSet(std::string_view name, const char *value);

	/**
	 * Canonicalize and check the document root.
	 *
	 * Throws on error.
	 */
	void Finish();
};

/**
 * Parse a TCP port number (1..65535).
 *
 * Throws std::runtime_error on error.
 */
uint_least16_t
ParsePort(const char *s);
