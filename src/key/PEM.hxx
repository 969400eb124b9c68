// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Verdict.hxx"

#include <string_view>

/**
 * Check whether a PEM private key container is encrypted, by
 * looking for a RFC 1421 "Proc-Type: 4,ENCRYPTED" header (or a
 * PKCS#8 "ENCRYPTED PRIVATE KEY" block).  A missing "Proc-Type"
 * header means "not encrypted".  Returns
 * EncryptionVerdict::UNKNOWN if the BEGIN or END line is missing.
 */
[[gnu::pure]]
EncryptionVerdict
CheckPEMEncryption(std::string_view contents) noexcept;
