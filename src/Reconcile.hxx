// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Report.hxx"

#include <optional>
#include <string>
#include <string_view>

class KeyTool;
struct DecodeResult;

/**
 * Build a #PublicKeyRecord from a public key line by fingerprinting
 * it.
 *
 * @return the record or std::nullopt if the line does not contain
 * a valid public key
 */
std::optional<PublicKeyRecord>
MakePublicKeyRecord(std::string_view line) noexcept;

/**
 * Obtain the public key of an unencrypted private key file: from
 * the container itself if the format embeds it, or else from the
 * external key tool.
 *
 * @return the record or std::nullopt if derivation or
 * fingerprinting failed
 */
std::optional<PublicKeyRecord>
DerivePublicKeyRecord(KeyTool &tool, const std::string &path,
		      const DecodeResult &decoded);

/**
 * Load the first public key line of the companion file
 * ("PATH.pub").
 *
 * @return the record or std::nullopt if there is no usable
 * companion file
 */
std::optional<PublicKeyRecord>
LoadCompanionPublicKey(const std::string &private_key_path) noexcept;

/**
 * Choose between the derived public key and the companion file's:
 * the companion wins if both fingerprints are equal (it has the
 * comment and options the derived key lacks).
 */
PublicKeyRecord
ReconcilePublicKey(PublicKeyRecord derived,
		   std::optional<PublicKeyRecord> companion) noexcept;
