// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "List.hxx"

using std::string_view_literals::operator""sv;

static constexpr bool
IsWhitespaceOrComma(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == ',';
}

static constexpr std::string_view
StripWhitespace(std::string_view s) noexcept
{
	while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
		s.remove_prefix(1);
	while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
		s.remove_suffix(1);
	return s;
}

static constexpr std::string_view
StripWeakPrefix(std::string_view etag) noexcept
{
	if (etag.starts_with("W/"sv))
		etag.remove_prefix(2);
	return etag;
}

static constexpr std::string_view
Unquote(std::string_view etag) noexcept
{
	if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"')
		etag = etag.substr(1, etag.size() - 2);
	return etag;
}

bool
http_list_is_wildcard(std::string_view list) noexcept
{
	return StripWhitespace(list) == "*"sv;
}

bool
http_etag_weak_equals(std::string_view a, std::string_view b) noexcept
{
	return Unquote(StripWeakPrefix(a)) == Unquote(StripWeakPrefix(b));
}

/**
 * Extract the next item from the list.  Quoted tags may contain
 * commas, therefore the quotes are honored.
 *
 * @return the item (empty at the end of the list)
 */
static std::string_view
NextItem(std::string_view &list) noexcept
{
	while (!list.empty() && IsWhitespaceOrComma(list.front()))
		list.remove_prefix(1);

	if (list.empty())
		return {};

	std::size_t i = list.starts_with("W/"sv) ? 2 : 0;
	if (i < list.size() && list[i] == '"') {
		const auto close = list.find('"', i + 1);
		i = close == list.npos ? list.size() : close + 1;
	}

	const auto comma = list.find(',', i);
	const auto end = comma == list.npos ? list.size() : comma;

	const auto item = StripWhitespace(list.substr(0, end));
	list.remove_prefix(end);
	return item;
}

bool
http_list_contains_etag(std::string_view list, std::string_view etag) noexcept
{
	while (true) {
		const auto item = NextItem(list);
		if (item.empty())
			return false;

		if (item == "*"sv || http_etag_weak_equals(item, etag))
			return true;
	}
}
