// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Conditional.hxx"
#include "Validators.hxx"
#include "http/HeaderMap.hxx"
#include "http/List.hxx"
#include "http/Date.hxx"
#include "beng-static/Headers.hxx"

using namespace BengStatic;

/**
 * Does the "If-Modified-Since" value indicate that the client's copy
 * is still current?
 */
static bool
IsNotModifiedSince(const char *if_modified_since,
		   std::chrono::system_clock::time_point last_modified) noexcept
{
	const auto t = http_date_parse(if_modified_since);
	if (t == std::chrono::system_clock::from_time_t(-1))
		return false;

	return last_modified <= t;
}

/**
 * Has the resource been modified after the "If-Unmodified-Since"
 * date?  Malformed dates are ignored.
 */
static bool
IsModifiedSince(const char *if_unmodified_since,
		std::chrono::system_clock::time_point last_modified) noexcept
{
	const auto t = http_date_parse(if_unmodified_since);
	if (t == std::chrono::system_clock::from_time_t(-1))
		return false;

	return last_modified > t;
}

ConditionalOutcome
EvaluateConditions(const HeaderMap &headers,
		   const Validators &validators) noexcept
{
	const char *p = headers.Get(IF_MATCH_HEADER);
	if (p != nullptr && !http_list_is_wildcard(p) &&
	    !http_list_contains_etag(p, validators.etag))
		return ConditionalOutcome::PRECONDITION_FAILED;

	if (p == nullptr) {
		const char *ius = headers.Get(IF_UNMODIFIED_SINCE_HEADER);
		if (ius != nullptr && IsModifiedSince(ius, validators.last_modified))
			return ConditionalOutcome::PRECONDITION_FAILED;
	}

	p = headers.Get(IF_NONE_MATCH_HEADER);
	if (p != nullptr) {
		if (http_list_is_wildcard(p) ||
		    http_list_contains_etag(p, validators.etag))
			return ConditionalOutcome::NOT_MODIFIED;

		/* entity tags take precedence; "If-Modified-Since" is
		   not evaluated */
		return ConditionalOutcome::FULL;
	}

	p = headers.Get(IF_MODIFIED_SINCE_HEADER);
	if (p != nullptr && IsNotModifiedSince(p, validators.last_modified))
		return ConditionalOutcome::NOT_MODIFIED;

	return ConditionalOutcome::FULL;
}
