// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/HeaderMap.hxx"

#include <gtest/gtest.h>

TEST(HeaderMap, Basic)
{
	HeaderMap headers;
	EXPECT_TRUE(headers.empty());
	EXPECT_EQ(headers.Get("if-match"), nullptr);

	headers.Add("If-Match", "\"a\"");
	EXPECT_FALSE(headers.empty());
	EXPECT_STREQ(headers.Get("if-match"), "\"a\"");
	EXPECT_EQ(headers.Get("If-Match"), nullptr);
	EXPECT_EQ(headers.Get("if-none-match"), nullptr);
}

TEST(HeaderMap, Repeated)
{
	HeaderMap headers;
	headers.Add("If-None-Match", "\"a\"");
	headers.Add("IF-NONE-MATCH", "\"b\"");
	headers.Add("if-none-match", "W/\"c\"");
	EXPECT_STREQ(headers.Get("if-none-match"), "\"a\", \"b\", W/\"c\"");
}
