// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HeaderMap.hxx"

#include <algorithm>

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? ch + ('a' - 'A')
		: ch;
}

void
HeaderMap::Add(std::string_view name, std::string_view value)
{
	std::string key(name);
	std::transform(key.begin(), key.end(), key.begin(), ToLowerASCII);

	auto [i, inserted] = map.try_emplace(std::move(key), value);
	if (!inserted) {
		i->second += ", ";
		i->second += value;
	}
}

const char *
HeaderMap::Get(std::string_view name) const noexcept
{
	const auto i = map.find(name);
	return i != map.end()
		? i->second.c_str()
		: nullptr;
}
