// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "file/Conditional.hxx"
#include "file/Validators.hxx"
#include "http/HeaderMap.hxx"

#include <gtest/gtest.h>

#include <initializer_list>
#include <utility>

using std::chrono::system_clock;

static const Validators validators{
	"W/\"5-59682f00-0\"",
	system_clock::from_time_t(784111777),
};

static constexpr const char *last_modified_string = "Sun, 06 Nov 1994 08:49:37 GMT";

static ConditionalOutcome
Evaluate(std::initializer_list<std::pair<const char *, const char *>> headers,
	 const Validators &v=validators)
{
	HeaderMap map;
	for (const auto &[name, value] : headers)
		map.Add(name, value);
	return EvaluateConditions(map, v);
}

TEST(Conditional, None)
{
	EXPECT_EQ(Evaluate({}), ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"Accept", "*/*"}}), ConditionalOutcome::FULL);
}

TEST(Conditional, IfMatch)
{
	EXPECT_EQ(Evaluate({{"If-Match", "*"}}), ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-Match", "\"5-59682f00-0\""}}),
		  ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-Match", "\"x\", W/\"5-59682f00-0\""}}),
		  ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-Match", "\"x\""}}),
		  ConditionalOutcome::PRECONDITION_FAILED);
	EXPECT_EQ(Evaluate({{"If-Match", "\"x\", \"y\""}}),
		  ConditionalOutcome::PRECONDITION_FAILED);
}

TEST(Conditional, IfMatchPriority)
{
	EXPECT_EQ(Evaluate({{"If-Match", "\"X\""}, {"If-None-Match", "*"}}),
		  ConditionalOutcome::PRECONDITION_FAILED);
	EXPECT_EQ(Evaluate({{"If-Match", "\"X\""},
			    {"If-Modified-Since", last_modified_string}}),
		  ConditionalOutcome::PRECONDITION_FAILED);

	/* a matching If-Match lets the other conditions decide */
	EXPECT_EQ(Evaluate({{"If-Match", "*"}, {"If-None-Match", "*"}}),
		  ConditionalOutcome::NOT_MODIFIED);
}

TEST(Conditional, IfNoneMatch)
{
	EXPECT_EQ(Evaluate({{"If-None-Match", "*"}}),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-None-Match", "W/\"5-59682f00-0\""}}),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-None-Match", "\"5-59682f00-0\""}}),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-None-Match", "\"a\", \"5-59682f00-0\""}}),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-None-Match", "\"a\""}, {"If-None-Match", "\"5-59682f00-0\""}}),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-None-Match", "\"other\""}}),
		  ConditionalOutcome::FULL);
}

TEST(Conditional, IfNoneMatchOverridesIfModifiedSince)
{
	EXPECT_EQ(Evaluate({{"If-None-Match", "\"other\""},
			    {"If-Modified-Since", last_modified_string}}),
		  ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-None-Match", "\"5-59682f00-0\""},
			    {"If-Modified-Since", "Sat, 01 Jan 1994 00:00:00 GMT"}}),
		  ConditionalOutcome::NOT_MODIFIED);
}

TEST(Conditional, IfModifiedSince)
{
	/* equal */
	EXPECT_EQ(Evaluate({{"If-Modified-Since", last_modified_string}}),
		  ConditionalOutcome::NOT_MODIFIED);

	/* later */
	EXPECT_EQ(Evaluate({{"If-Modified-Since", "Sun, 06 Nov 1994 08:49:38 GMT"}}),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-Modified-Since", "Fri, 01 Jan 2100 00:00:00 GMT"}}),
		  ConditionalOutcome::NOT_MODIFIED);

	/* one second earlier */
	EXPECT_EQ(Evaluate({{"If-Modified-Since", "Sun, 06 Nov 1994 08:49:36 GMT"}}),
		  ConditionalOutcome::FULL);
}

TEST(Conditional, IfModifiedSinceMalformed)
{
	EXPECT_EQ(Evaluate({{"If-Modified-Since", "yesterday"}}),
		  ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-Modified-Since", ""}}),
		  ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-Modified-Since", "Sunday, 06-Nov-94 08:49:37 GMT"}}),
		  ConditionalOutcome::FULL);
}

TEST(Conditional, IfUnmodifiedSince)
{
	EXPECT_EQ(Evaluate({{"If-Unmodified-Since", last_modified_string}}),
		  ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-Unmodified-Since", "Sun, 06 Nov 1994 08:49:38 GMT"}}),
		  ConditionalOutcome::FULL);
	EXPECT_EQ(Evaluate({{"If-Unmodified-Since", "Sun, 06 Nov 1994 08:49:36 GMT"}}),
		  ConditionalOutcome::PRECONDITION_FAILED);
	EXPECT_EQ(Evaluate({{"If-Unmodified-Since", "garbage"}}),
		  ConditionalOutcome::FULL);

	/* If-Match takes precedence */
	EXPECT_EQ(Evaluate({{"If-Match", "*"},
			    {"If-Unmodified-Since", "Sun, 06 Nov 1994 08:49:36 GMT"}}),
		  ConditionalOutcome::FULL);
}

TEST(Conditional, StrongETag)
{
	const Validators v{
		"\"5d41402abc4b2a76b9719d911017c592\"",
		system_clock::from_time_t(784111777),
	};

	EXPECT_EQ(Evaluate({{"If-None-Match", "\"5d41402abc4b2a76b9719d911017c592\""}}, v),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-None-Match", "W/\"5d41402abc4b2a76b9719d911017c592\""}}, v),
		  ConditionalOutcome::NOT_MODIFIED);
	EXPECT_EQ(Evaluate({{"If-Match", "\"5d41402abc4b2a76b9719d911017c592\""}}, v),
		  ConditionalOutcome::FULL);
}
