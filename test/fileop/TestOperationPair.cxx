// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "fileop/OperationPair.hxx"

#include <gtest/gtest.h>

using namespace FileOp;

TEST(OperationPairTest, Scalar)
{
	EXPECT_EQ(Canonicalize("a", "b"),
		  (OperationPairList{{"a", "b"}}));
}

TEST(OperationPairTest, ListToScalar)
{
	const std::vector<std::string> sources{"a", "b", "c"};
	EXPECT_EQ(Canonicalize(sources, "dir"),
		  (OperationPairList{{"a", "dir"}, {"b", "dir"}, {"c", "dir"}}));
}

TEST(OperationPairTest, Parallel)
{
	const std::vector<std::string> sources{"a", "b"};
	const std::vector<std::string> targets{"x", "y"};
	EXPECT_EQ(Canonicalize(sources, targets),
		  (OperationPairList{{"a", "x"}, {"b", "y"}}));
}

TEST(OperationPairTest, Empty)
{
	const std::vector<std::string> empty;
	EXPECT_TRUE(Canonicalize(empty, "dir").empty());
	EXPECT_TRUE(Canonicalize(empty, empty).empty());
}

TEST(OperationPairTest, LengthMismatch)
{
	const std::vector<std::string> sources{"a", "b"};
	const std::vector<std::string> targets{"x"};

	try {
		Canonicalize(sources, targets);
		FAIL();
	} catch (const std::invalid_argument &e) {
		EXPECT_STREQ(e.what(), "Got 2 sources but 1 targets");
	}
}
