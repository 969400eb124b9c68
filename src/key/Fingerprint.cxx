// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Fingerprint.hxx"
#include "PublicKeyLine.hxx"
#include "KeyType.hxx"
#include "Base64.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/Digest.hxx"
#include "openssl/DeserializeBN.hxx"

#include <stdexcept>

using std::string_view_literals::operator""sv;

std::string
FormatMD5Fingerprint(std::span<const std::byte> digest)
{
	static constexpr char hex_digits[] = "0123456789abcdef";

	std::string result;
	result.reserve(digest.size() * 3);

	for (const std::byte b : digest) {
		if (!result.empty())
			result.push_back(':');

		const auto value = static_cast<unsigned>(b);
		result.push_back(hex_digits[value >> 4]);
		result.push_back(hex_digits[value & 0xf]);
	}

	return result;
}

[[gnu::pure]]
static unsigned
GetCurveBits(std::string_view curve_name) noexcept
{
	if (curve_name == "nistp256"sv)
		return 256;
	else if (curve_name == "nistp384"sv)
		return 384;
	else if (curve_name == "nistp521"sv)
		return 521;
	else
		return 0;
}

/**
 * Determine the key size from the algorithm-specific part of a
 * public key blob.
 */
static unsigned
GetKeyBits(std::string_view algorithm, SSH::Deserializer &d)
{
	if (algorithm == "ssh-rsa"sv) {
		d.ReadLengthEncoded(); // e
		return CountBIGNUMBits(d.ReadLengthEncoded());
	} else if (algorithm == "ssh-dss"sv) {
		return CountBIGNUMBits(d.ReadLengthEncoded()); // p
	} else if (algorithm.starts_with("ecdsa-sha2-"sv) ||
		   algorithm == "sk-ecdsa-sha2-nistp256@openssh.com"sv) {
		return GetCurveBits(d.ReadString());
	} else if (algorithm == "ssh-ed25519"sv ||
		   algorithm == "sk-ssh-ed25519@openssh.com"sv) {
		if (d.ReadLengthEncoded().size() != 32)
			throw std::invalid_argument{"Malformed ed25519 key"};
		return 256;
	} else
		return 0;
}

/**
 * Strip "-cert-v01@openssh.com", but keep the "@openssh.com"
 * suffix of security key algorithms.
 */
[[gnu::pure]]
static std::string_view
GetCertifiedAlgorithm(std::string_view algorithm) noexcept
{
	static constexpr auto cert_suffix = "-cert-v01@openssh.com"sv;
	algorithm.remove_suffix(cert_suffix.size());

	if (algorithm.starts_with("sk-"sv))
		return algorithm == "sk-ssh-ed25519"sv
			? "sk-ssh-ed25519@openssh.com"sv
			: "sk-ecdsa-sha2-nistp256@openssh.com"sv;

	return algorithm;
}

KeyListing
FingerprintPublicKeyBlob(std::span<const std::byte> blob)
try {
	SSH::Deserializer d{blob};
	std::string_view algorithm = d.ReadString();

	KeyListing result;
	result.type = GetKeyTypeName(algorithm);

	if (IsCertificateAlgorithm(algorithm)) {
		d.ReadLengthEncoded(); // nonce
		algorithm = GetCertifiedAlgorithm(algorithm);
	}

	result.bits = GetKeyBits(algorithm, d);
	result.fingerprint = FormatMD5Fingerprint(CalcMD5({blob}));
	return result;
} catch (SSH::MalformedPacket) {
	throw std::invalid_argument{"Malformed public key blob"};
}

/**
 * The SSH1 fingerprint is the MD5 of the modulus followed by the
 * exponent, both without length prefix.
 */
static KeyListing
FingerprintSSH1PublicKey(const PublicKeyLine &line)
{
	const auto e = BN_dec2bn(std::string{line.exponent});
	const auto n = BN_dec2bn(std::string{line.modulus});
	if (!e || !n)
		throw std::invalid_argument{"Malformed SSH1 public key"};

	const auto n_bin = BN_bn2bin(*n);
	const auto e_bin = BN_bn2bin(*e);

	return {
		.type = std::string{KEY_TYPE_RSA1},
		.bits = static_cast<unsigned>(BN_num_bits(n.get())),
		.fingerprint = FormatMD5Fingerprint(CalcMD5({n_bin, e_bin})),
	};
}

KeyListing
FingerprintPublicKey(const PublicKeyLine &line)
{
	if (line.IsSSH1())
		return FingerprintSSH1PublicKey(line);

	const auto blob = DecodeBase64(line.blob);
	if (!blob)
		throw std::invalid_argument{"Malformed base64 in public key"};

	/* the algorithm in front of the blob must match the one
	   inside */
	SSH::Deserializer d{*blob};
	try {
		if (d.ReadString() != line.algorithm)
			throw std::invalid_argument{"Key type mismatch"};
	} catch (SSH::MalformedPacket) {
		throw std::invalid_argument{"Malformed public key blob"};
	}

	return FingerprintPublicKeyBlob(*blob);
}

std::optional<KeyListing>
FingerprintPublicKeyLine(std::string_view s) noexcept
try {
	const auto line = ParsePublicKeyLine(s);
	if (!line)
		return std::nullopt;

	return FingerprintPublicKey(*line);
} catch (const std::exception &) {
	return std::nullopt;
}
