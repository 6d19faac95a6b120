// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Resolve.hxx"
#include "uri/Escape.hxx"
#include "Logger.hxx"
#include "SystemError.hxx"

#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

std::optional<NormalizedPath>
NormalizePath(std::string_view path)
{
	NormalizedPath result;
	result.trailing_slash = path.ends_with('/');

	std::vector<std::string_view> segments;

	while (!path.empty()) {
		const auto slash = path.find('/');
		const auto segment = path.substr(0, slash);
		path = slash == path.npos
			? std::string_view{}
			: path.substr(slash + 1);

		if (segment.empty() || segment == "."sv)
			continue;

		if (segment == ".."sv) {
			if (segments.empty())
				return std::nullopt;

			segments.pop_back();
			continue;
		}

		segments.push_back(segment);
	}

	for (const auto segment : segments) {
		if (!result.relative.empty())
			result.relative.push_back('/');
		result.relative.append(segment);
	}

	return result;
}

/**
 * Does this errno value mean that the object does not exist or is
 * not accessible to us?
 */
static constexpr bool
IsNotFoundErrno(int e) noexcept
{
	switch (e) {
	case ENOENT:
	case ENOTDIR:
	case EACCES:
	case EPERM:
	case ELOOP:
	case ENAMETOOLONG:
	case ENXIO:
	case ENODEV:
		return true;

	default:
		return false;
	}
}

[[gnu::pure]]
static bool
IsBeneath(std::string_view path, std::string_view root) noexcept
{
	if (!path.starts_with(root))
		return false;

	if (path.size() == root.size())
		return true;

	return root.ends_with('/') || path[root.size()] == '/';
}

ResolvedEntity
ResolvePath(std::string_view root, std::string_view request_path)
{
	if (request_path.find('\0') != request_path.npos)
		return ResolvedEntity::InvalidPath();

	std::string decoded(request_path.size(), '\0');
	char *end = uri_unescape(decoded.data(), request_path);
	if (end == nullptr)
		return ResolvedEntity::InvalidPath();

	decoded.resize(end - decoded.data());

	auto normalized = NormalizePath(decoded);
	if (!normalized)
		return ResolvedEntity::InvalidPath();

	std::string joined(root);
	if (!normalized->relative.empty()) {
		if (!joined.ends_with('/'))
			joined.push_back('/');
		joined.append(normalized->relative);
	}

	char canonical[PATH_MAX];
	if (realpath(joined.c_str(), canonical) == nullptr) {
		const int e = errno;
		if (IsNotFoundErrno(e))
			return ResolvedEntity::Absent();

		throw FmtErrno(e, "Failed to resolve '{}'", joined);
	}

	if (!IsBeneath(canonical, root)) {
		LogFmt(4, "resolve", "'{}' points outside of the document root",
		       joined);
		return ResolvedEntity::Absent();
	}

	UniqueFd fd{open(canonical, O_RDONLY|O_NOCTTY|O_CLOEXEC|O_NONBLOCK)};
	if (!fd.IsDefined()) {
		const int e = errno;
		if (IsNotFoundErrno(e))
			return ResolvedEntity::Absent();

		throw FmtErrno(e, "Failed to open '{}'", canonical);
	}

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw FmtErrno(errno, "Failed to stat '{}'", canonical);

	ResolvedEntity::Kind kind;
	if (S_ISREG(st.st_mode)) {
		if (normalized->trailing_slash)
			/* a regular file can't be addressed like a
			   directory */
			return ResolvedEntity::Absent();

		kind = ResolvedEntity::Kind::FILE;
	} else if (S_ISDIR(st.st_mode)) {
		kind = ResolvedEntity::Kind::DIRECTORY;
	} else
		return ResolvedEntity::Absent();

	ResolvedEntity entity{kind};
	entity.path = canonical;
	entity.relative = std::move(normalized->relative);
	entity.fd = std::move(fd);
	entity.st = st;
	return entity;
}
