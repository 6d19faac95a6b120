// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <utility>

#include <unistd.h>

/**
 * Owns a file descriptor and closes it in the destructor.
 */
class UniqueFd {
	int fd = -1;

public:
	UniqueFd() noexcept = default;

	explicit UniqueFd(int _fd) noexcept
		:fd(_fd) {}

	UniqueFd(UniqueFd &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFd() noexcept {
		if (IsDefined())
			close(fd);
	}

	UniqueFd &operator=(UniqueFd &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	/**
	 * Give up ownership and return the descriptor.
	 */
	int Release() noexcept {
		return std::exchange(fd, -1);
	}
};
