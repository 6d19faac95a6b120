// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/format.h>

#include <atomic>
#include <iterator>

#include <stdio.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

void
LogVFmt(std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	auto out = std::back_inserter(buffer);

	if (!domain.empty())
		out = fmt::format_to(out, "[{}] ", domain);

	out = fmt::vformat_to(out, format_str, args);
	*out++ = '\n';

	fwrite(buffer.data(), 1, buffer.size(), stderr);
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		std::string msg = e.what();

		try {
			std::rethrow_if_nested(e);
		} catch (...) {
			msg += ": ";
			msg += GetFullMessage(std::current_exception());
		}

		return msg;
	} catch (const char *s) {
		return s;
	} catch (...) {
		return "Unknown exception";
	}
}

void
PrintException(std::exception_ptr ep) noexcept
{
	fmt::print(stderr, "{}\n", GetFullMessage(ep));
}

void
Logger::Log(unsigned level, std::string_view prefix,
	    std::exception_ptr ep) const noexcept
{
	if (!CheckLogLevel(level))
		return;

	LogFmt(level, domain, "{}: {}", prefix, GetFullMessage(ep));
}
