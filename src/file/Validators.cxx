// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Validators.hxx"
#include "Resolve.hxx"
#include "DirectoryListing.hxx"
#include "Digest.hxx"

#include <fmt/core.h>

#include <assert.h>

static std::chrono::system_clock::time_point
ToTimePoint(const struct timespec &ts) noexcept
{
	return std::chrono::system_clock::from_time_t(ts.tv_sec);
}

Validators
ComputeFileValidators(const ResolvedEntity &file, ETagPolicy policy)
{
	assert(file.IsFile());

	const auto &st = file.st;

	Validators v;
	v.last_modified = ToTimePoint(st.st_mtim);

	switch (policy) {
	case ETagPolicy::STAT:
		v.etag = fmt::format("W/\"{:x}-{:x}-{:x}\"",
				     (uint_least64_t)st.st_size,
				     (uint_least64_t)st.st_mtim.tv_sec,
				     (uint_least64_t)st.st_mtim.tv_nsec);
		break;

	case ETagPolicy::DIGEST:
		v.etag = fmt::format("\"{}\"", MD5HexFile(file.fd.Get(), file.path));
		break;
	}

	return v;
}

/**
 * Feed the sorted entry list into the digest; every entry adds its
 * name, a slash for directories and a newline.
 */
static std::string
DigestListing(const DirectoryListing &listing)
{
	std::string buffer;
	for (const auto &i : listing.entries) {
		buffer.append(i.name);
		if (i.is_directory)
			buffer.push_back('/');
		buffer.push_back('\n');
	}

	auto digest = MD5Hex(buffer);
	digest.resize(16);
	return digest;
}

Validators
ComputeDirectoryValidators(const ResolvedEntity &directory,
			   const DirectoryListing &listing)
{
	assert(directory.IsDirectory());

	const auto &st = directory.st;

	Validators v;
	v.last_modified = listing.latest_modified;
	v.etag = fmt::format("W/\"{}-{:x}-{:x}\"",
			     DigestListing(listing),
			     (uint_least64_t)st.st_mtim.tv_sec,
			     (uint_least64_t)st.st_mtim.tv_nsec);
	return v;
}

Validators
ComputeValidators(const ResolvedEntity &entity, ETagPolicy policy)
{
	if (entity.IsDirectory())
		return ComputeDirectoryValidators(entity,
						  LoadDirectoryListing(entity));

	return ComputeFileValidators(entity, policy);
}
