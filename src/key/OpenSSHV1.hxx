// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Verdict.hxx"

#include <string_view>

/**
 * Check the cipher name of an "openssh-key-v1" container: the
 * base64 body between the BEGIN and END lines is decoded, and the
 * first string after the magic (offset 15, its four-byte length
 * prefix followed by the name) must be "none" for an unencrypted
 * key.  Returns EncryptionVerdict::UNKNOWN if the END line is
 * missing, the base64 is malformed or the decoded buffer is too
 * short.
 */
EncryptionVerdict
CheckOpenSSHV1Encryption(std::string_view contents) noexcept;
