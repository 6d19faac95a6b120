// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

class HeaderMap;
struct Validators;

enum class ConditionalOutcome : uint_least8_t {
	FULL,
	NOT_MODIFIED,
	PRECONDITION_FAILED,
};

/**
 * Evaluate the "If-Match", "If-Unmodified-Since", "If-None-Match"
 * and "If-Modified-Since" request headers (RFC 7232 6) against the
 * validators of the selected resource.  Malformed dates are
 * ignored.
 */
[[gnu::pure]]
ConditionalOutcome
EvaluateConditions(const HeaderMap &headers,
		   const Validators &validators) noexcept;
