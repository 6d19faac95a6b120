// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

/**
 * Set the global verbosity.  Messages with a level above this
 * value are discarded.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

static inline bool
CheckLogLevel(unsigned level) noexcept
{
	return GetLogLevel() >= level;
}

void
LogVFmt(std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Format a message and write it to stderr, prefixed with the
 * domain in square brackets.
 */
template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	LogVFmt(domain, format_str, fmt::make_format_args(args...));
}

/**
 * Build a message from the exception and all exceptions nested
 * inside it, separated by colons.
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * Print the full exception message to stderr, regardless of the
 * log level.  Meant for fatal errors in main().
 */
void
PrintException(std::exception_ptr ep) noexcept;

class Logger {
	const std::string domain;

public:
	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str, std::forward<Args>(args)...);
	}

	void Log(unsigned level, std::string_view msg) const noexcept {
		LogFmt(level, domain, "{}", msg);
	}

	void Log(unsigned level, std::string_view prefix,
		 std::exception_ptr ep) const noexcept;
};
