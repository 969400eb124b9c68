// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "FileInfo.hxx"
#include "key/KeyType.hxx"
#include "key/Verdict.hxx"

#include <string>
#include <string_view>

/**
 * Public key material derived from a private key file or adopted
 * from its companion ".pub" file.
 */
struct PublicKeyRecord {
	std::string type{KEY_TYPE_UNKNOWN};

	unsigned bits = 0;

	/**
	 * 47 character colon-hex MD5 fingerprint, or empty.
	 */
	std::string fingerprint;

	/**
	 * The full public key line (with options and comment), or
	 * empty if only a fingerprint is known.
	 */
	std::string line;

	/**
	 * False if this record was adopted from a companion file
	 * without checking that it matches the private key.
	 */
	bool verified = true;

	bool operator==(const PublicKeyRecord &) const noexcept = default;
};

/**
 * The result of processing one private key file.
 */
struct KeyReport {
	std::string path;

	FileMetadata file;

	KeyFormat format = KeyFormat::UNRECOGNIZED;

	EncryptionVerdict encryption = EncryptionVerdict::UNKNOWN;

	PublicKeyRecord key;

	/**
	 * The boolean "encrypted" output field; UNKNOWN is reported
	 * as "not encrypted".
	 */
	bool IsEncrypted() const noexcept {
		return encryption == EncryptionVerdict::ENCRYPTED;
	}
};

/**
 * One identity held by a SSH agent.
 */
struct AgentIdentity {
	std::string socket_path;

	FileMetadata socket;

	std::string type{KEY_TYPE_UNKNOWN};

	unsigned bits = 0;

	std::string fingerprint;

	/**
	 * The path of the key file on the (possibly remote) host
	 * which loaded the identity, if the comment names one.
	 */
	std::string remote_path;
};

/**
 * One key line of an "authorized_keys" file.
 */
struct AuthorizedKeyReport {
	std::string path;

	FileMetadata file;

	std::string type{KEY_TYPE_UNKNOWN};

	unsigned bits = 0;

	std::string fingerprint;

	std::string line;
};

/**
 * The fields of one output line, in output order.
 */
struct OutputRecord {
	const FileMetadata &file;
	std::string_view fingerprint;
	unsigned bits;
	std::string_view type;
	bool encrypted;
	std::string_view path;
	std::string_view trailer;
};

/**
 * Format a record as one ';'-separated line (without line
 * terminator): "owner;group;mode;mtime;fingerprint;bits;type;
 * encrypted;path;trailer".  Empty fields are kept; an empty type
 * is written as "NA".
 */
std::string
FormatRecord(const OutputRecord &record);

std::string
FormatKeyReport(const KeyReport &report);

std::string
FormatAgentIdentity(const AgentIdentity &identity);

std::string
FormatAuthorizedKeyReport(const AuthorizedKeyReport &report);
