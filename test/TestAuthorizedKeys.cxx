// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "KeyFixtures.hxx"
#include "TempDirectory.hxx"
#include "auth/AuthorizedKeys.hxx"
#include "scan/Passwd.hxx"
#include "StringUtil.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static const PasswdEntry alice{
	.name = "alice",
	.uid = 1000,
	.gid = 1000,
	.home = "/home/alice",
};

TEST(AuthorizedKeys, DefaultFiles)
{
	const std::vector<std::string> expected{
		".ssh/authorized_keys",
		".ssh/authorized_keys2",
	};

	EXPECT_EQ(ParseAuthorizedKeysFiles(""sv), expected);
	EXPECT_EQ(ParseAuthorizedKeysFiles("# AuthorizedKeysFile /etc/keys\n"
					   "PermitRootLogin no\n"sv),
		  expected);
}

TEST(AuthorizedKeys, ParseSshdConfig)
{
	const std::vector<std::string> expected{
		"/etc/ssh/keys/%u",
		".ssh/authorized_keys",
	};

	EXPECT_EQ(ParseAuthorizedKeysFiles("Port 22\n"
					   "  authorizedkeysfile  /etc/ssh/keys/%u .ssh/authorized_keys\n"
					   "AuthorizedKeysFile /second\n"sv),
		  expected);

	EXPECT_EQ(ParseAuthorizedKeysFiles("AuthorizedKeysFile=\"/etc/ssh/keys/%u\" .ssh/authorized_keys\n"sv),
		  expected);

	EXPECT_TRUE(ParseAuthorizedKeysFiles("AuthorizedKeysFile none\n"sv).empty());

	/* settings inside "Match" blocks apply only to some users */
	EXPECT_EQ(ParseAuthorizedKeysFiles("Match User bob\n"
					   "AuthorizedKeysFile /bob\n"sv).size(),
		  2U);
}

TEST(AuthorizedKeys, Expand)
{
	EXPECT_EQ(ExpandAuthorizedKeysPattern(".ssh/authorized_keys"sv, alice),
		  "/home/alice/.ssh/authorized_keys"sv);
	EXPECT_EQ(ExpandAuthorizedKeysPattern("%h/.ssh/keys"sv, alice),
		  "/home/alice/.ssh/keys"sv);
	EXPECT_EQ(ExpandAuthorizedKeysPattern("/etc/ssh/keys/%u"sv, alice),
		  "/etc/ssh/keys/alice"sv);
	EXPECT_EQ(ExpandAuthorizedKeysPattern("/var/keys/%U"sv, alice),
		  "/var/keys/1000"sv);
	EXPECT_EQ(ExpandAuthorizedKeysPattern("/keys/100%%"sv, alice),
		  "/keys/100%"sv);
}

TEST(AuthorizedKeys, LoadFile)
{
	const TempDirectory tmp;

	std::string contents{"# keys for alice\n\n"};
	contents.append("no-pty,from=\"10.0.0.1\" ");
	contents.append(ed25519_public_key);
	contents.append("this is not a key\n");
	contents.append(rsa_pem_public_key);

	const auto path = tmp.WriteFile("authorized_keys", contents, 0644);
	const auto reports = LoadAuthorizedKeysFile(path);
	ASSERT_EQ(reports.size(), 2U);

	EXPECT_EQ(reports[0].path, path);
	EXPECT_EQ(reports[0].type, "ED25519"sv);
	EXPECT_EQ(reports[0].bits, 256U);
	EXPECT_EQ(reports[0].fingerprint, ed25519_fingerprint);
	EXPECT_TRUE(reports[0].line.starts_with("no-pty,from=\"10.0.0.1\" ssh-ed25519 "sv));
	EXPECT_EQ(reports[0].file.mode, 0644U);

	EXPECT_EQ(reports[1].type, "RSA"sv);
	EXPECT_EQ(reports[1].fingerprint, rsa_pem_fingerprint);
	EXPECT_EQ(reports[1].line, Strip(rsa_pem_public_key));

	const auto record = FormatAuthorizedKeyReport(reports[1]);
	EXPECT_NE(record.find(";08:b6:31:4f:5c:11:49:87:f7:5e:f3:8c:be:d9:62:8f;1024;RSA;0;"sv),
		  record.npos);
	EXPECT_TRUE(record.ends_with(Strip(rsa_pem_public_key)));

	EXPECT_TRUE(LoadAuthorizedKeysFile((tmp / "missing").native()).empty());
}

TEST(AuthorizedKeys, Inventory)
{
	const TempDirectory tmp;
	tmp.WriteFile("etc/passwd",
		      "root:x:0:0:root:/root:/bin/sh\n"
		      "alice:x:1000:1000::/home/alice:/bin/sh\n"
		      "alias:x:1001:1000::/home/alice:/bin/sh\n"
		      "bob:x:1002:1002::/home/bob:/bin/sh\n");
	tmp.WriteFile("etc/ssh/sshd_config",
		      "AuthorizedKeysFile .ssh/authorized_keys /etc/ssh/keys/%u\n");
	tmp.WriteFile("home/alice/.ssh/authorized_keys", ed25519_public_key);
	tmp.WriteFile("etc/ssh/keys/bob", ecdsa_public_key);

	const auto users = LoadPasswd(tmp.GetPath());
	ASSERT_EQ(users.size(), 4U);

	std::vector<AuthorizedKeyReport> reports;
	InventoryAuthorizedKeys(tmp.GetPath(), users,
				[&reports](AuthorizedKeyReport &&report){
					reports.emplace_back(std::move(report));
				});

	/* alice's file is reported once even though "alias" shares
	   the home directory */
	ASSERT_EQ(reports.size(), 2U);
	EXPECT_EQ(reports[0].path, (tmp / "home/alice/.ssh/authorized_keys").native());
	EXPECT_EQ(reports[0].fingerprint, ed25519_fingerprint);
	EXPECT_EQ(reports[1].path, (tmp / "etc/ssh/keys/bob").native());
	EXPECT_EQ(reports[1].fingerprint, ecdsa_fingerprint);
}
