// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Construct std::system_error instances from errno values with a
 * message formatted by libfmt.
 */

#pragma once

#include <fmt/core.h>

#include <system_error>

std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename... Args>
std::system_error
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}
