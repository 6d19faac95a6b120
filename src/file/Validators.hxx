// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Cache validators (entity tag and modification time) for resolved
 * files and directories.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

struct ResolvedEntity;
struct DirectoryListing;

enum class ETagPolicy : uint_least8_t {
	/**
	 * Weak tags derived from size and modification time.
	 */
	STAT,

	/**
	 * Strong tags for files, derived from the MD5 digest of the
	 * contents.
	 */
	DIGEST,
};

struct Validators {
	/**
	 * The quoted entity tag, with "W/" prefix if it is weak.
	 */
	std::string etag;

	/**
	 * Truncated to whole seconds.
	 */
	std::chrono::system_clock::time_point last_modified;
};

/**
 * Throws std::system_error if the file cannot be read (only with
 * #ETagPolicy::DIGEST).
 */
Validators
ComputeFileValidators(const ResolvedEntity &file, ETagPolicy policy);

/**
 * Directory validators do not depend on the #ETagPolicy.
 *
 * @param listing the directory's listing, which must have been
 * loaded from the same #ResolvedEntity
 */
Validators
ComputeDirectoryValidators(const ResolvedEntity &directory,
			   const DirectoryListing &listing);

/**
 * Compute the validators of a file or directory.  Directories are
 * enumerated for this; callers which need the listing anyway should
 * use ComputeDirectoryValidators().
 *
 * Throws std::system_error on I/O errors.
 */
Validators
ComputeValidators(const ResolvedEntity &entity, ETagPolicy policy);
