// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Map request paths to filesystem objects beneath the document root.
 */

#pragma once

#include "io/UniqueFd.hxx"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <sys/stat.h>

/**
 * The result of resolving a request path.  Constructed for one
 * request and never cached.
 */
struct ResolvedEntity {
	enum class Kind : uint_least8_t {
		/**
		 * The path does not exist, cannot be read or is not a
		 * regular file or a directory.
		 */
		ABSENT,

		/**
		 * The path attempted to escape the document root.
		 */
		INVALID_PATH,

		FILE,
		DIRECTORY,
	};

	Kind kind;

	/**
	 * The canonical absolute path; empty unless #kind is FILE or
	 * DIRECTORY.
	 */
	std::string path;

	/**
	 * The normalized path relative to the document root, without
	 * leading and trailing slash; empty for the root itself.
	 */
	std::string relative;

	/**
	 * A read-only descriptor of the file or the directory.
	 */
	UniqueFd fd;

	struct stat st{};

	explicit ResolvedEntity(Kind _kind) noexcept
		:kind(_kind) {}

	static ResolvedEntity Absent() noexcept {
		return ResolvedEntity{Kind::ABSENT};
	}

	static ResolvedEntity InvalidPath() noexcept {
		return ResolvedEntity{Kind::INVALID_PATH};
	}

	bool IsFile() const noexcept {
		return kind == Kind::FILE;
	}

	bool IsDirectory() const noexcept {
		return kind == Kind::DIRECTORY;
	}

	bool Exists() const noexcept {
		return IsFile() || IsDirectory();
	}
};

struct NormalizedPath {
	/**
	 * The path relative to the root, segments separated by a
	 * single slash, no leading or trailing slash.
	 */
	std::string relative;

	/**
	 * Did the original path end with a slash?
	 */
	bool trailing_slash = false;
};

/**
 * Collapse empty, "." and ".." segments of an already decoded path.
 *
 * @return std::nullopt if a ".." segment would climb above the root
 */
std::optional<NormalizedPath>
NormalizePath(std::string_view path);

/**
 * Resolve a request path (as received, percent-encoded, without
 * query string) against the document root.
 *
 * Throws std::system_error on unexpected I/O errors.
 *
 * @param root the canonical absolute path of the document root
 */
ResolvedEntity
ResolvePath(std::string_view root, std::string_view request_path);
