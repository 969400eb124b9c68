// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Base64.hxx"

#include <sodium/utils.h>

static std::optional<SecretBuffer>
DecodeBase64(std::string_view src, const char *ignore)
{
	SecretBuffer result{src.size() / 4 * 3 + 3};
	const auto dest = result.Write();

	std::size_t decoded_size;
	const char *end;
	if (sodium_base642bin(reinterpret_cast<unsigned char *>(dest.data()),
			      dest.size(),
			      src.data(), src.size(),
			      ignore, &decoded_size, &end,
			      sodium_base64_VARIANT_ORIGINAL) != 0)
		return std::nullopt;

	/* trailing garbage */
	if (end != src.data() + src.size())
		return std::nullopt;

	result.SetSize(decoded_size);
	return result;
}

std::optional<SecretBuffer>
DecodeBase64(std::string_view src)
{
	return DecodeBase64(src, nullptr);
}

std::optional<SecretBuffer>
DecodeBase64IgnoreWhitespace(std::string_view src)
{
	return DecodeBase64(src, " \t\r\n");
}
