// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Response.hxx"
#include "Resolve.hxx"
#include "Validators.hxx"
#include "Conditional.hxx"
#include "MimeType.hxx"
#include "http/Date.hxx"
#include "beng-static/Headers.hxx"

#include <fmt/core.h>

#include <assert.h>

using namespace BengStatic;

StaticResponse
BuildErrorResponse(HttpStatus status) noexcept
{
	return StaticResponse{status};
}

static void
AddHeader(ResponseHeaders &headers, std::string_view name,
	  std::string_view value)
{
	headers.insert_or_assign(std::string{name}, std::string{value});
}

static void
AddValidatorHeaders(ResponseHeaders &headers, const Validators &validators)
{
	AddHeader(headers, ETAG_HEADER, validators.etag);
	AddHeader(headers, LAST_MODIFIED_HEADER,
		  http_date_format(validators.last_modified));
}

static void
AddContentHeaders(ResponseHeaders &headers, std::string_view content_type,
		  uint_least64_t length)
{
	AddHeader(headers, CONTENT_TYPE_HEADER, content_type);
	AddHeader(headers, CONTENT_LENGTH_HEADER, fmt::format("{}", length));
}

StaticResponse
BuildResponse(HttpMethod method, ResolvedEntity &&entity,
	      ConditionalOutcome outcome, const Validators &validators,
	      std::string &&listing, const MimeTypeTable &mime_types)
{
	assert(entity.Exists());

	switch (outcome) {
	case ConditionalOutcome::FULL:
		break;

	case ConditionalOutcome::NOT_MODIFIED:
		{
			StaticResponse response{HttpStatus::NOT_MODIFIED};
			AddValidatorHeaders(response.headers, validators);
			return response;
		}

	case ConditionalOutcome::PRECONDITION_FAILED:
		{
			StaticResponse response{HttpStatus::PRECONDITION_FAILED};
			AddValidatorHeaders(response.headers, validators);
			return response;
		}
	}

	StaticResponse response{HttpStatus::OK};
	AddValidatorHeaders(response.headers, validators);

	if (entity.IsDirectory()) {
		AddContentHeaders(response.headers,
				  DIRECTORY_LISTING_CONTENT_TYPE,
				  listing.size());

		if (method != HttpMethod::HEAD)
			response.body = std::move(listing);
	} else {
		const off_t size = entity.st.st_size;

		AddContentHeaders(response.headers,
				  mime_types.Lookup(entity.relative),
				  size);

		if (method != HttpMethod::HEAD)
			response.body = FileBody{std::move(entity.fd), size};
	}

	return response;
}
