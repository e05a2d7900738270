// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class MyConfigParser final
	: public ConfigParser, public std::vector<std::string> {
public:
	bool finished = false;

	void ParseLine(LineParser &line) override {
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected");
		line.ExpectEnd();
		emplace_back(value);
	}

	void Finish() override {
		finished = true;
	}
};

TEST(ConfigParserTest, CommentConfigParser)
{
	std::string text =
		"# comment\n"
		"foo\n"
		"\n"
		"  'bar baz'  \n"
		"\"with \\\"escape\\\"\"\n"
		"   # indented comment\n"
		"/some/path";

	MyConfigParser p;
	CommentConfigParser c(p);
	ParseConfigText("test.conf", text.data(), c);

	ASSERT_TRUE(p.finished);
	ASSERT_EQ(p, (std::vector<std::string>{
				"foo",
				"bar baz",
				"with \"escape\"",
				"/some/path",
			}));
}

TEST(ConfigParserTest, Error)
{
	std::string text = "foo\n\n'unterminated\n";

	MyConfigParser p;
	CommentConfigParser c(p);

	try {
		ParseConfigText("test.conf", text.data(), c);
		FAIL();
	} catch (...) {
		ASSERT_EQ(GetFullMessage(std::current_exception()),
			  "test.conf:3; Quoted value expected");
	}

	ASSERT_FALSE(p.finished);
}

TEST(ConfigParserTest, LineParser)
{
	char buffer[] = "  word yes 42 'quoted value'  ";
	LineParser line(buffer);

	ASSERT_STREQ(line.ExpectWord(), "word");
	ASSERT_TRUE(line.NextBool());
	ASSERT_EQ(line.NextPositiveInteger(), 42u);
	ASSERT_STREQ(line.ExpectValueAndEnd(), "quoted value");
}
