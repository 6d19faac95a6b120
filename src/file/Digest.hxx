// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * MD5 digests (OpenSSL) for entity tags.
 */

#pragma once

#include <string>
#include <string_view>

/**
 * Calculate the MD5 digest of a buffer and return it as 32
 * lower-case hex digits.
 *
 * Throws on OpenSSL failure.
 */
std::string
MD5Hex(std::string_view data);

/**
 * Calculate the MD5 digest of the whole contents of a file,
 * reading it in chunks with pread() (the file offset is not
 * modified).
 *
 * @param path the path of the file, only used for error messages
 *
 * Throws on I/O or OpenSSL failure.
 */
std::string
MD5HexFile(int fd, std::string_view path);
