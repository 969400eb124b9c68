// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "KeyType.hxx"

using std::string_view_literals::operator""sv;

static constexpr auto cert_suffix = "-cert-v01@openssh.com"sv;

struct KeyTypeName {
	std::string_view algorithm, name;
};

static constexpr KeyTypeName key_type_names[] = {
	{"ssh-rsa"sv, "RSA"sv},
	{"ssh-dss"sv, "DSA"sv},
	{"ecdsa-sha2-nistp256"sv, "ECDSA"sv},
	{"ecdsa-sha2-nistp384"sv, "ECDSA"sv},
	{"ecdsa-sha2-nistp521"sv, "ECDSA"sv},
	{"ssh-ed25519"sv, "ED25519"sv},
	{"sk-ecdsa-sha2-nistp256@openssh.com"sv, "ECDSA-SK"sv},
	{"sk-ssh-ed25519@openssh.com"sv, "ED25519-SK"sv},
};

static constexpr KeyTypeName cert_type_names[] = {
	{"ssh-rsa"sv, "RSA-CERT"sv},
	{"ssh-dss"sv, "DSA-CERT"sv},
	{"ecdsa-sha2-nistp256"sv, "ECDSA-CERT"sv},
	{"ecdsa-sha2-nistp384"sv, "ECDSA-CERT"sv},
	{"ecdsa-sha2-nistp521"sv, "ECDSA-CERT"sv},
	{"ssh-ed25519"sv, "ED25519-CERT"sv},
	{"sk-ecdsa-sha2-nistp256"sv, "ECDSA-SK-CERT"sv},
	{"sk-ssh-ed25519"sv, "ED25519-SK-CERT"sv},
};

bool
IsCertificateAlgorithm(std::string_view algorithm) noexcept
{
	return algorithm.ends_with(cert_suffix);
}

std::string_view
GetKeyTypeName(std::string_view algorithm) noexcept
{
	if (IsCertificateAlgorithm(algorithm)) {
		algorithm.remove_suffix(cert_suffix.size());

		for (const auto &i : cert_type_names)
			if (i.algorithm == algorithm)
				return i.name;
	} else {
		for (const auto &i : key_type_names)
			if (i.algorithm == algorithm)
				return i.name;
	}

	return KEY_TYPE_UNKNOWN;
}

bool
MaybeKeyAlgorithm(std::string_view word) noexcept
{
	return word.starts_with("ssh-"sv) ||
		word.starts_with("ecdsa-"sv) ||
		word.starts_with("sk-"sv);
}
