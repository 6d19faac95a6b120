// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handler.hxx"
#include "Resolve.hxx"
#include "Validators.hxx"
#include "Conditional.hxx"
#include "DirectoryListing.hxx"
#include "Config.hxx"
#include "Logger.hxx"

static const Logger handler_logger("static");
static const Logger access_logger("access");

static StaticResponse
HandleDirectory(const StaticConfig &config, const StaticRequest &request,
		ResolvedEntity &&directory)
{
	if (!config.directory_listing)
		return BuildErrorResponse(HttpStatus::NOT_FOUND);

	const auto listing = LoadDirectoryListing(directory);
	const auto validators = ComputeDirectoryValidators(directory, listing);
	const auto outcome = EvaluateConditions(request.headers, validators);

	std::string html;
	if (outcome == ConditionalOutcome::FULL)
		html = RenderDirectoryListing(listing, directory.relative);

	return BuildResponse(request.method, std::move(directory),
			     outcome, validators, std::move(html),
			     config.mime_types);
}

static StaticResponse
HandleFile(const StaticConfig &config, const StaticRequest &request,
	   ResolvedEntity &&file)
{
	const auto validators = ComputeFileValidators(file, config.etag_policy);
	const auto outcome = EvaluateConditions(request.headers, validators);

	return BuildResponse(request.method, std::move(file),
			     outcome, validators, {},
			     config.mime_types);
}

static StaticResponse
HandleResolved(const StaticConfig &config, const StaticRequest &request)
{
	auto entity = ResolvePath(config.document_root, request.uri);

	switch (entity.kind) {
	case ResolvedEntity::Kind::ABSENT:
		return BuildErrorResponse(HttpStatus::NOT_FOUND);

	case ResolvedEntity::Kind::INVALID_PATH:
		return BuildErrorResponse(HttpStatus::BAD_REQUEST);

	case ResolvedEntity::Kind::FILE:
		return HandleFile(config, request, std::move(entity));

	case ResolvedEntity::Kind::DIRECTORY:
		return HandleDirectory(config, request, std::move(entity));
	}

	return BuildErrorResponse(HttpStatus::INTERNAL_SERVER_ERROR);
}

StaticResponse
HandleStaticRequest(const StaticConfig &config,
		    const StaticRequest &request) noexcept
{
	StaticResponse response{HttpStatus::INTERNAL_SERVER_ERROR};

	try {
		response = HandleResolved(config, request);
	} catch (...) {
		handler_logger.Log(1, request.uri, std::current_exception());
		response = BuildErrorResponse(HttpStatus::INTERNAL_SERVER_ERROR);
	}

	access_logger.Fmt(4, "{} {} {}",
			  http_method_to_string(request.method),
			  request.uri, (unsigned)response.status);

	return response;
}
