// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Generate HTML listings of directories.
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

struct ResolvedEntity;

struct DirectoryEntry {
	std::string name;

	bool is_directory;

	friend bool operator==(const DirectoryEntry &,
			       const DirectoryEntry &) noexcept = default;
};

struct DirectoryListing {
	/**
	 * Sorted by name (byte-wise), directories and files
	 * interleaved.  Never contains "." and "..".
	 */
	std::vector<DirectoryEntry> entries;

	/**
	 * The latest modification time of the directory itself and
	 * its direct children, truncated to seconds.
	 */
	std::chrono::system_clock::time_point latest_modified;

	bool empty() const noexcept {
		return entries.empty();
	}
};

/**
 * Enumerate the children of a resolved directory.  Symlinks are
 * followed to determine whether a child is a directory; entries
 * which vanish while enumerating are skipped.
 *
 * Throws std::system_error on I/O errors.
 */
DirectoryListing
LoadDirectoryListing(const ResolvedEntity &directory);

/**
 * Render the listing as a HTML document.  The output depends only on
 * the parameters.
 *
 * @param relative the normalized path of the directory relative to
 * the document root (without leading and trailing slash)
 */
std::string
RenderDirectoryListing(const DirectoryListing &listing,
		       std::string_view relative);
