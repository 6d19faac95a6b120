// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "SystemError.hxx"

#include <stdexcept>

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

uint_least16_t
ParsePort(const char *s)
{
	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse port number");

	if (value == 0 || value > 65535)
		throw std::runtime_error("Port number out of range");

	return value;
}

static bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0)
		return true;
	else if (strcmp(s, "no") == 0)
		return false;
	else
		throw std::runtime_error("Failed to parse boolean value (yes/no expected)");
}

static ETagPolicy
ParseETagPolicy(const char *s)
{
	if (strcmp(s, "stat") == 0)
		return ETagPolicy::STAT;
	else if (strcmp(s, "digest") == 0)
		return ETagPolicy::DIGEST;
	else
		throw std::runtime_error("Invalid value (stat/digest expected)");
}

void
StaticConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "document_root"sv) {
		if (*value == 0)
			throw std::runtime_error("Empty path");

		document_root = value;
	} else if (name == "listen"sv) {
		if (*value == 0)
			throw std::runtime_error("Empty address");

		listen_address = value;
	} else if (name == "port"sv) {
		port = ParsePort(value);
	} else if (name == "etag"sv) {
		etag_policy = ParseETagPolicy(value);
	} else if (name == "directory_listing"sv) {
		directory_listing = ParseBool(value);
	} else if (name.starts_with("content_type."sv)) {
		name.remove_prefix(13);

		try {
			mime_types.Set(name, value);
		} catch (const std::invalid_argument &e) {
			throw std::runtime_error(e.what());
		}
	} else
		throw std::runtime_error("Unknown variable");
}

void
StaticConfig::Finish()
{
	char buffer[PATH_MAX];
	if (realpath(document_root.c_str(), buffer) == nullptr)
		throw FmtErrno(errno, "Failed to resolve document root '{}'",
			       document_root);

	struct stat st;
	if (stat(buffer, &st) < 0)
		throw FmtErrno(errno, "Failed to stat document root '{}'",
			       buffer);

	if (!S_ISDIR(st.st_mode))
		throw FmtErrno(ENOTDIR, "Document root '{}' is not a directory",
			       buffer);

	if (access(buffer, R_OK|X_OK) < 0)
		throw FmtErrno(errno, "Document root '{}' is not accessible",
			       buffer);

	document_root = buffer;
}
