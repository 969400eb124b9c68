// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Report.hxx"

#include <fmt/format.h>

#include <iterator>

using std::string_view_literals::operator""sv;

[[gnu::pure]]
static bool
NeedsEscape(char ch, bool allow_separator) noexcept
{
	return static_cast<unsigned char>(ch) < 0x20 || ch == '\\' ||
		(ch == ';' && !allow_separator);
}

/**
 * Escape control characters (and the field separator, unless this
 * is the last field) as "\xNN" so every record stays on one line
 * with a fixed number of fields.
 */
static void
AppendEscaped(fmt::memory_buffer &buffer, std::string_view s,
	      bool allow_separator=false)
{
	for (const char ch : s) {
		if (NeedsEscape(ch, allow_separator))
			fmt::format_to(std::back_inserter(buffer), "\\x{:02x}"sv,
				       static_cast<unsigned char>(ch));
		else
			buffer.push_back(ch);
	}
}

std::string
FormatRecord(const OutputRecord &record)
{
	fmt::memory_buffer buffer;
	const auto out = std::back_inserter(buffer);

	AppendEscaped(buffer, record.file.owner);
	buffer.push_back(';');
	AppendEscaped(buffer, record.file.group);
	fmt::format_to(out, ";{:o};{};"sv, record.file.mode,
		       static_cast<long long>(record.file.mtime));
	AppendEscaped(buffer, record.fingerprint);
	fmt::format_to(out, ";{};"sv, record.bits);
	AppendEscaped(buffer, record.type.empty() ? KEY_TYPE_UNKNOWN : record.type);
	fmt::format_to(out, ";{};"sv, record.encrypted ? 1 : 0);
	AppendEscaped(buffer, record.path);
	buffer.push_back(';');
	AppendEscaped(buffer, record.trailer, true);

	return fmt::to_string(buffer);
}

std::string
FormatKeyReport(const KeyReport &report)
{
	return FormatRecord({
		.file = report.file,
		.fingerprint = report.key.fingerprint,
		.bits = report.key.bits,
		.type = report.key.type,
		.encrypted = report.IsEncrypted(),
		.path = report.path,
		.trailer = report.key.line,
	});
}

std::string
FormatAgentIdentity(const AgentIdentity &identity)
{
	std::string trailer;
	if (!identity.remote_path.empty())
		trailer = fmt::format("remote_path={}"sv, identity.remote_path);

	return FormatRecord({
		.file = identity.socket,
		.fingerprint = identity.fingerprint,
		.bits = identity.bits,
		.type = identity.type,
		.encrypted = false,
		.path = identity.socket_path,
		.trailer = trailer,
	});
}

std::string
FormatAuthorizedKeyReport(const AuthorizedKeyReport &report)
{
	return FormatRecord({
		.file = report.file,
		.fingerprint = report.fingerprint,
		.bits = report.bits,
		.type = report.type,
		.encrypted = false,
		.path = report.path,
		.trailer = report.line,
	});
}
