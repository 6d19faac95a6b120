// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "file/Response.hxx"
#include "file/Resolve.hxx"
#include "file/Validators.hxx"
#include "file/Conditional.hxx"
#include "file/MimeType.hxx"

#include <gtest/gtest.h>

using std::chrono::system_clock;

class ResponseTest : public ::testing::Test {
protected:
	TempDirectory root;
	MimeTypeTable mime_types;

	const Validators validators{
		"W/\"5-59682f00-0\"",
		system_clock::from_time_t(1500000000),
	};

	void SetUp() override {
		root.WriteFile("example.txt", "hello");
		root.MakeDirectory("images");
	}

	StaticResponse Build(HttpMethod method, std::string_view path,
			     ConditionalOutcome outcome,
			     std::string listing={}) {
		return BuildResponse(method, ResolvePath(root.GetPath(), path),
				     outcome, validators, std::move(listing),
				     mime_types);
	}
};

TEST(ResponseError, NoValidators)
{
	for (auto status : {HttpStatus::NOT_FOUND, HttpStatus::BAD_REQUEST,
			    HttpStatus::INTERNAL_SERVER_ERROR}) {
		const auto r = BuildErrorResponse(status);
		EXPECT_EQ(r.status, status);
		EXPECT_TRUE(r.headers.empty());
		EXPECT_FALSE(r.HasBody());
	}
}

TEST_F(ResponseTest, File)
{
	const auto r = Build(HttpMethod::GET, "/example.txt",
			     ConditionalOutcome::FULL);
	EXPECT_EQ(r.status, HttpStatus::OK);
	EXPECT_STREQ(r.GetHeader("Content-Type"), "text/plain");
	EXPECT_STREQ(r.GetHeader("Content-Length"), "5");
	EXPECT_STREQ(r.GetHeader("ETag"), "W/\"5-59682f00-0\"");
	EXPECT_STREQ(r.GetHeader("Last-Modified"), "Fri, 14 Jul 2017 02:40:00 GMT");

	const auto *body = std::get_if<FileBody>(&r.body);
	ASSERT_NE(body, nullptr);
	EXPECT_TRUE(body->fd.IsDefined());
	EXPECT_EQ(body->size, 5);

	char buffer[16];
	EXPECT_EQ(pread(body->fd.Get(), buffer, sizeof(buffer), 0), 5);
	EXPECT_EQ(std::string_view(buffer, 5), "hello");
}

TEST_F(ResponseTest, FileHead)
{
	const auto get = Build(HttpMethod::GET, "/example.txt",
			       ConditionalOutcome::FULL);
	const auto head = Build(HttpMethod::HEAD, "/example.txt",
				ConditionalOutcome::FULL);
	EXPECT_EQ(head.status, get.status);
	EXPECT_EQ(head.headers, get.headers);
	EXPECT_FALSE(head.HasBody());
}

TEST_F(ResponseTest, Directory)
{
	const auto r = Build(HttpMethod::GET, "/images/",
			     ConditionalOutcome::FULL, "<html></html>");
	EXPECT_EQ(r.status, HttpStatus::OK);
	EXPECT_STREQ(r.GetHeader("Content-Type"), "text/html");
	EXPECT_STREQ(r.GetHeader("Content-Length"), "13");
	EXPECT_STREQ(r.GetHeader("ETag"), "W/\"5-59682f00-0\"");
	EXPECT_NE(r.GetHeader("Last-Modified"), nullptr);

	const auto *body = std::get_if<std::string>(&r.body);
	ASSERT_NE(body, nullptr);
	EXPECT_EQ(*body, "<html></html>");
}

TEST_F(ResponseTest, DirectoryHead)
{
	const auto r = Build(HttpMethod::HEAD, "/images/",
			     ConditionalOutcome::FULL, "<html></html>");
	EXPECT_EQ(r.status, HttpStatus::OK);
	EXPECT_STREQ(r.GetHeader("Content-Length"), "13");
	EXPECT_FALSE(r.HasBody());
}

TEST_F(ResponseTest, NotModified)
{
	for (auto method : {HttpMethod::GET, HttpMethod::HEAD}) {
		const auto r = Build(method, "/example.txt",
				     ConditionalOutcome::NOT_MODIFIED);
		EXPECT_EQ(r.status, HttpStatus::NOT_MODIFIED);
		EXPECT_STREQ(r.GetHeader("ETag"), "W/\"5-59682f00-0\"");
		EXPECT_STREQ(r.GetHeader("Last-Modified"), "Fri, 14 Jul 2017 02:40:00 GMT");
		EXPECT_EQ(r.GetHeader("Content-Length"), nullptr);
		EXPECT_EQ(r.GetHeader("Content-Type"), nullptr);
		EXPECT_FALSE(r.HasBody());
	}
}

TEST_F(ResponseTest, PreconditionFailed)
{
	const auto r = Build(HttpMethod::GET, "/images",
			     ConditionalOutcome::PRECONDITION_FAILED,
			     "<html></html>");
	EXPECT_EQ(r.status, HttpStatus::PRECONDITION_FAILED);
	EXPECT_STREQ(r.GetHeader("ETag"), "W/\"5-59682f00-0\"");
	EXPECT_NE(r.GetHeader("Last-Modified"), nullptr);
	EXPECT_FALSE(r.HasBody());
}

TEST_F(ResponseTest, ContentTypeOverride)
{
	mime_types.Set("txt", "text/plain; charset=utf-8");

	const auto r = Build(HttpMethod::GET, "/example.txt",
			     ConditionalOutcome::FULL);
	EXPECT_STREQ(r.GetHeader("Content-Type"), "text/plain; charset=utf-8");
}

TEST_F(ResponseTest, ContentTypeFromRequestName)
{
	root.Symlink("example.txt", "link.png");

	const auto r = Build(HttpMethod::GET, "/link.png",
			     ConditionalOutcome::FULL);
	EXPECT_STREQ(r.GetHeader("Content-Type"), "image/png");
}

TEST_F(ResponseTest, EmptyFile)
{
	root.WriteFile("empty.bin", "");

	const auto r = Build(HttpMethod::GET, "/empty.bin",
			     ConditionalOutcome::FULL);
	EXPECT_EQ(r.status, HttpStatus::OK);
	EXPECT_STREQ(r.GetHeader("Content-Type"), "application/octet-stream");
	EXPECT_STREQ(r.GetHeader("Content-Length"), "0");
}
