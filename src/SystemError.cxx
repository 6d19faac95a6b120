// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SystemError.hxx"

#include <fmt/format.h>

std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::system_error(std::error_code(code, std::system_category()),
				 fmt::vformat(format_str, args));
}
