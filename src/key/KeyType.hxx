// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string_view>

/**
 * The key type name used in output records when the type is not
 * known.
 */
constexpr std::string_view KEY_TYPE_UNKNOWN = "NA";

/**
 * The key type name of SSH protocol 1 RSA keys.
 */
constexpr std::string_view KEY_TYPE_RSA1 = "RSA1";

/**
 * Map a SSH public key algorithm identifier (e.g. "ssh-rsa") to
 * the short key type name used in output records (e.g. "RSA").
 * Certificate algorithms get a "-CERT" suffix.
 *
 * @return the type name or #KEY_TYPE_UNKNOWN
 */
[[gnu::pure]]
std::string_view
GetKeyTypeName(std::string_view algorithm) noexcept;

/**
 * Is this a "*-cert-v01@openssh.com" certificate algorithm?
 */
[[gnu::pure]]
bool
IsCertificateAlgorithm(std::string_view algorithm) noexcept;

/**
 * Could this word be a public key algorithm identifier (as opposed
 * to authorized_keys options)?
 */
[[gnu::pure]]
bool
MaybeKeyAlgorithm(std::string_view word) noexcept;
