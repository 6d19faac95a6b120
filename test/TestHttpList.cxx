// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/List.hxx"

#include <gtest/gtest.h>

TEST(HttpList, Wildcard)
{
	EXPECT_TRUE(http_list_is_wildcard("*"));
	EXPECT_TRUE(http_list_is_wildcard(" * "));
	EXPECT_FALSE(http_list_is_wildcard("\"*\""));
	EXPECT_FALSE(http_list_is_wildcard("\"a\", *"));
	EXPECT_FALSE(http_list_is_wildcard(""));
}

TEST(HttpList, WeakEquals)
{
	EXPECT_TRUE(http_etag_weak_equals("\"a\"", "\"a\""));
	EXPECT_TRUE(http_etag_weak_equals("W/\"a\"", "\"a\""));
	EXPECT_TRUE(http_etag_weak_equals("\"a\"", "W/\"a\""));
	EXPECT_TRUE(http_etag_weak_equals("W/\"a\"", "W/\"a\""));
	EXPECT_FALSE(http_etag_weak_equals("\"a\"", "\"b\""));
	EXPECT_FALSE(http_etag_weak_equals("W/\"a\"", "W/\"ab\""));

	/* sloppy clients */
	EXPECT_TRUE(http_etag_weak_equals("a", "\"a\""));
	EXPECT_TRUE(http_etag_weak_equals("W/\"a\"", "a"));
}

TEST(HttpList, ContainsETag)
{
	EXPECT_TRUE(http_list_contains_etag("\"a\"", "\"a\""));
	EXPECT_TRUE(http_list_contains_etag("\"a\", \"b\"", "\"b\""));
	EXPECT_TRUE(http_list_contains_etag("\"a\",\"b\"", "W/\"b\""));
	EXPECT_TRUE(http_list_contains_etag(" \"x\" ,  W/\"b\" ,\"c\"", "\"b\""));
	EXPECT_TRUE(http_list_contains_etag("\"a\", *", "\"z\""));
	EXPECT_TRUE(http_list_contains_etag("a, b", "\"b\""));

	EXPECT_FALSE(http_list_contains_etag("", "\"a\""));
	EXPECT_FALSE(http_list_contains_etag(",,", "\"a\""));
	EXPECT_FALSE(http_list_contains_etag("\"a\", \"b\"", "\"c\""));
	EXPECT_FALSE(http_list_contains_etag("\"ab\"", "\"a\""));
}

TEST(HttpList, QuotedComma)
{
	EXPECT_TRUE(http_list_contains_etag("\"a,b\", \"c\"", "\"a,b\""));
	EXPECT_TRUE(http_list_contains_etag("\"a,b\", \"c\"", "\"c\""));
	EXPECT_FALSE(http_list_contains_etag("\"a,b\"", "\"a\""));
}
