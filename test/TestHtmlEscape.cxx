// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "escape/HTML.hxx"

#include <gtest/gtest.h>

TEST(HtmlEscape, Basic)
{
	EXPECT_EQ(html_escape(""), "");
	EXPECT_EQ(html_escape("foo bar"), "foo bar");
	EXPECT_EQ(html_escape("foo&bar"), "foo&amp;bar");
	EXPECT_EQ(html_escape("<>"), "&lt;&gt;");
	EXPECT_EQ(html_escape("\""), "&quot;");
	EXPECT_EQ(html_escape("&amp;"), "&amp;amp;");
	EXPECT_EQ(html_escape("it's"), "it&apos;s");
	EXPECT_EQ(html_escape("<script>alert(\"x\")</script>"),
		  "&lt;script&gt;alert(&quot;x&quot;)&lt;/script&gt;");

	/* UTF-8 passes through */
	EXPECT_EQ(html_escape("\xc3\xbc"), "\xc3\xbc");
}

TEST(HtmlEscape, Size)
{
	EXPECT_EQ(html_escape_size(""), 0u);
	EXPECT_EQ(html_escape_size("abc"), 3u);
	EXPECT_EQ(html_escape_size("a&b"), 7u);
	EXPECT_EQ(html_escape_size("<'>"), 14u);
	EXPECT_EQ(html_escape_size("&<>\"'"), html_escape("&<>\"'").size());
}

TEST(HtmlEscape, Append)
{
	std::string s = "<p>";
	html_escape_append(s, "a<b");
	s += "</p>";
	EXPECT_EQ(s, "<p>a&lt;b</p>");
}
