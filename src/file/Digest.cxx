// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Digest.hxx"
#include "SystemError.hxx"

#include <openssl/evp.h>

#include <fmt/format.h>

#include <iterator>
#include <memory>
#include <stdexcept>

#include <errno.h>
#include <unistd.h>

namespace {

struct EvpMdCtxDeleter {
	void operator()(EVP_MD_CTX *ctx) const noexcept {
		EVP_MD_CTX_free(ctx);
	}
};

using UniqueEvpMdCtx = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

class MD5Context {
	UniqueEvpMdCtx ctx{EVP_MD_CTX_new()};

public:
	MD5Context() {
		if (!ctx)
			throw std::bad_alloc{};

		if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
			throw std::runtime_error{"EVP_DigestInit_ex() failed"};
	}

	void Update(const void *data, std::size_t size) {
		if (EVP_DigestUpdate(ctx.get(), data, size) != 1)
			throw std::runtime_error{"EVP_DigestUpdate() failed"};
	}

	std::string FinalHex() {
		unsigned char md[EVP_MAX_MD_SIZE];
		unsigned md_size;
		if (EVP_DigestFinal_ex(ctx.get(), md, &md_size) != 1)
			throw std::runtime_error{"EVP_DigestFinal_ex() failed"};

		std::string result;
		result.reserve(md_size * 2);
		for (unsigned i = 0; i < md_size; ++i)
			fmt::format_to(std::back_inserter(result),
				       "{:02x}", md[i]);
		return result;
	}
};

} // anonymous namespace

std::string
MD5Hex(std::string_view data)
{
	MD5Context md5;
	md5.Update(data.data(), data.size());
	return md5.FinalHex();
}

std::string
MD5HexFile(int fd, std::string_view path)
{
	MD5Context md5;

	char buffer[65536];
	off_t offset = 0;

	while (true) {
		const ssize_t nbytes = pread(fd, buffer, sizeof(buffer), offset);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw FmtErrno(errno, "Failed to read '{}'", path);
		}

		if (nbytes == 0)
			break;

		md5.Update(buffer, nbytes);
		offset += nbytes;
	}

	return md5.FinalHex();
}
