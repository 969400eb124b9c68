// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Digest.hxx"
#include "Error.hxx"

#include <openssl/evp.h>

#include <memory>

struct EVP_MD_CTX_Deleter {
	void operator()(EVP_MD_CTX *ctx) const noexcept {
		EVP_MD_CTX_free(ctx);
	}
};

MD5Digest
CalcMD5(std::initializer_list<std::span<const std::byte>> src)
{
	const std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx{EVP_MD_CTX_new()};
	if (!ctx)
		throw SslError{"EVP_MD_CTX_new() failed"};

	if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
		throw SslError{"EVP_DigestInit_ex() failed"};

	for (const auto i : src)
		if (EVP_DigestUpdate(ctx.get(), i.data(), i.size()) != 1)
			throw SslError{"EVP_DigestUpdate() failed"};

	MD5Digest digest;
	unsigned size = digest.size();
	if (EVP_DigestFinal_ex(ctx.get(),
			       reinterpret_cast<unsigned char *>(digest.data()),
			       &size) != 1 ||
	    size != digest.size())
		throw SslError{"EVP_DigestFinal_ex() failed"};

	return digest;
}
