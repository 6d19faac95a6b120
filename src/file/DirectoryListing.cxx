// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DirectoryListing.hxx"
#include "Resolve.hxx"
#include "escape/HTML.hxx"
#include "uri/Escape.hxx"
#include "SystemError.hxx"

#include <algorithm>
#include <memory>

#include <assert.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

namespace {

struct DirCloser {
	void operator()(DIR *dir) const noexcept {
		closedir(dir);
	}
};

using UniqueDir = std::unique_ptr<DIR, DirCloser>;

} // anonymous namespace

/**
 * Open a new directory stream on the given directory.  A fresh
 * descriptor is opened so the stream has its own offset and the
 * caller's descriptor stays usable.
 */
static UniqueDir
OpenDirectoryStream(const ResolvedEntity &directory)
{
	const int fd = openat(directory.fd.Get(), ".",
			      O_RDONLY|O_DIRECTORY|O_CLOEXEC);
	if (fd < 0)
		throw FmtErrno(errno, "Failed to open directory '{}'",
			       directory.path);

	DIR *dir = fdopendir(fd);
	if (dir == nullptr) {
		const int e = errno;
		close(fd);
		throw FmtErrno(e, "Failed to open directory '{}'",
			       directory.path);
	}

	return UniqueDir{dir};
}

[[gnu::pure]]
static bool
IsSpecialFilename(const char *name) noexcept
{
	return name[0] == '.' &&
		(name[1] == 0 || (name[1] == '.' && name[2] == 0));
}

/**
 * Obtain the status of a child entry, following symlinks.  A
 * dangling symlink is described by its own status.
 *
 * @return false if the entry has vanished
 */
static bool
StatChild(const ResolvedEntity &directory, const char *name,
	  struct stat &st)
{
	if (fstatat(directory.fd.Get(), name, &st, 0) == 0)
		return true;

	int e = errno;
	if (e == ENOENT || e == ELOOP) {
		if (fstatat(directory.fd.Get(), name, &st,
			    AT_SYMLINK_NOFOLLOW) == 0)
			return true;

		e = errno;
		if (e == ENOENT)
			return false;
	}

	throw FmtErrno(e, "Failed to stat '{}/{}'", directory.path, name);
}

DirectoryListing
LoadDirectoryListing(const ResolvedEntity &directory)
{
	assert(directory.IsDirectory());

	DirectoryListing listing;
	time_t latest = directory.st.st_mtim.tv_sec;

	const auto dir = OpenDirectoryStream(directory);

	while (true) {
		errno = 0;
		const struct dirent *ent = readdir(dir.get());
		if (ent == nullptr) {
			if (errno != 0)
				throw FmtErrno(errno, "Failed to read directory '{}'",
					       directory.path);
			break;
		}

		if (IsSpecialFilename(ent->d_name))
			continue;

		struct stat st;
		if (!StatChild(directory, ent->d_name, st))
			continue;

		latest = std::max(latest, st.st_mtim.tv_sec);
		listing.entries.push_back({ent->d_name, S_ISDIR(st.st_mode)});
	}

	std::sort(listing.entries.begin(), listing.entries.end(),
		  [](const DirectoryEntry &a, const DirectoryEntry &b){
			  return a.name < b.name;
		  });

	listing.latest_modified = std::chrono::system_clock::from_time_t(latest);
	return listing;
}

/**
 * Build the absolute URI of the directory, each segment
 * percent-encoded, with a trailing slash.
 */
static std::string
MakeDirectoryUri(std::string_view relative)
{
	std::string uri = "/";

	while (!relative.empty()) {
		const auto slash = relative.find('/');
		uri_escape_append(uri, relative.substr(0, slash));
		uri.push_back('/');

		if (slash == relative.npos)
			break;

		relative = relative.substr(slash + 1);
	}

	return uri;
}

std::string
RenderDirectoryListing(const DirectoryListing &listing,
		       std::string_view relative)
{
	std::string display = "/";
	if (!relative.empty()) {
		display.append(relative);
		display.push_back('/');
	}

	std::string html = "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">";

	html += "<title>Index of ";
	html_escape_append(html, display);
	html += "</title><base href=\"";
	html_escape_append(html, MakeDirectoryUri(relative));
	html += "\"></head>\n<body><h1>Index of ";
	html_escape_append(html, display);
	html += "</h1>\n";

	if (listing.empty()) {
		html += "<p>empty directory</p>\n";
	} else {
		html += "<ul>\n";

		for (const auto &i : listing.entries) {
			const std::string_view suffix = i.is_directory ? "/"sv : ""sv;

			std::string href;
			uri_escape_append(href, i.name);

			html += "<li><a href=\"";
			html_escape_append(html, href);
			html += suffix;
			html += "\">";
			html_escape_append(html, i.name);
			html += suffix;
			html += "</a></li>\n";
		}

		html += "</ul>\n";
	}

	html += "</body></html>\n";
	return html;
}
