// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "fileop/IoGuard.hxx"
#include "fileop/Choice.hxx"

#include <gtest/gtest.h>

#include <errno.h>

using namespace FileOp;

TEST(IoGuardTest, FormatIoError)
{
	EXPECT_EQ(FormatIoError(IoOperation::OPEN, "/a", ENOENT),
		  "Cannot open source file \"/a\"\nNo such file or directory");
	EXPECT_EQ(FormatIoError(IoOperation::CLOSE_TARGET, "/b", ENOSPC),
		  "Cannot close target file \"/b\"\nNo space left on device");
	EXPECT_EQ(FormatIoError(IoOperation::OPENDIR, "/c", EACCES),
		  "Cannot read directory \"/c\"\nPermission denied");
	EXPECT_EQ(FormatIoError(IoOperation::ALLOCATE, "/d", ENOMEM),
		  "Cannot allocate a transfer buffer for \"/d\"\nCannot allocate memory");
}

TEST(IoGuardTest, Reports)
{
	EXPECT_EQ(FormatSameFile("/a", "/b"),
		  "\"/a\"\nand\n\"/b\"\nare the same file");
	EXPECT_EQ(FormatMustBeDirectory("/d"),
		  "Destination \"/d\" must be a directory");
	EXPECT_EQ(FormatSubdirectoryOfItself("/a", "/a/b"),
		  "An attempt was made to make '/a' a subdirectory ('/a/b') of itself.");
	EXPECT_EQ(FormatUnsupportedType("special"),
		  "I don't know how to copy files of type 'special'");
}

TEST(IoGuardTest, InvalidChoice)
{
	try {
		ThrowInvalidChoice("overwrite", 42);
		FAIL();
	} catch (const InvalidChoice &e) {
		EXPECT_STREQ(e.what(), "Invalid choice 42 for overwrite");
	}
}
