// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Date.hxx"

#include <fmt/format.h>

#include <time.h>

static constexpr char wdays[8][4] = {
	"Sun",
	"Mon",
	"Tue",
	"Wed",
	"Thu",
	"Fri",
	"Sat",
	"???",
};

static constexpr char months[13][4] = {
	"Jan",
	"Feb",
	"Mar",
	"Apr",
	"May",
	"Jun",
	"Jul",
	"Aug",
	"Sep",
	"Oct",
	"Nov",
	"Dec",
	"???",
};

static constexpr const char *
wday_name(int wday) noexcept
{
	return wdays[wday >= 0 && wday < 7 ? wday : 7];
}

static constexpr const char *
month_name(int month) noexcept
{
	return months[month >= 0 && month < 12 ? month : 12];
}

void
http_date_format_r(char *buffer, std::chrono::system_clock::time_point t) noexcept
{
	const time_t tt = std::chrono::system_clock::to_time_t(t);
	struct tm tm;
	if (gmtime_r(&tt, &tm) == nullptr) {
		*buffer = 0;
		return;
	}

	const auto result =
		fmt::format_to_n(buffer, HTTP_DATE_BUFFER_SIZE - 1,
				 "{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT",
				 wday_name(tm.tm_wday), tm.tm_mday,
				 month_name(tm.tm_mon), tm.tm_year + 1900,
				 tm.tm_hour, tm.tm_min, tm.tm_sec);
	*result.out = 0;
}

std::string
http_date_format(std::chrono::system_clock::time_point t)
{
	char buffer[HTTP_DATE_BUFFER_SIZE];
	http_date_format_r(buffer, t);
	return buffer;
}

static constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

static int
parse_2digit(const char *p) noexcept
{
	if (!IsDigitASCII(p[0]) || !IsDigitASCII(p[1]))
		return -1;

	return (p[0] - '0') * 10 + (p[1] - '0');
}

static int
parse_4digit(const char *p) noexcept
{
	if (!IsDigitASCII(p[0]) || !IsDigitASCII(p[1]) ||
	    !IsDigitASCII(p[2]) || !IsDigitASCII(p[3]))
		return -1;

	return (p[0] - '0') * 1000 + (p[1] - '0') * 100
		+ (p[2] - '0') * 10 + (p[3] - '0');
}

static int
parse_month_name(std::string_view p) noexcept
{
	for (int i = 0; i < 12; ++i)
		if (p == months[i])
			return i;

	return -1;
}

static bool
is_wday_name(std::string_view p) noexcept
{
	for (int i = 0; i < 7; ++i)
		if (p == wdays[i])
			return true;

	return false;
}

std::chrono::system_clock::time_point
http_date_parse(std::string_view s) noexcept
{
	const auto error = std::chrono::system_clock::from_time_t(-1);

	/* "Sun, 06 Nov 1994 08:49:37 GMT" */
	if (s.size() != HTTP_DATE_BUFFER_SIZE - 1)
		return error;

	const char *p = s.data();
	if (!is_wday_name(s.substr(0, 3)) || p[3] != ',' || p[4] != ' ' ||
	    p[7] != ' ' || p[11] != ' ' || p[16] != ' ' ||
	    p[19] != ':' || p[22] != ':' || s.substr(25) != " GMT")
		return error;

	struct tm tm{};
	tm.tm_sec = parse_2digit(p + 23);
	tm.tm_min = parse_2digit(p + 20);
	tm.tm_hour = parse_2digit(p + 17);
	tm.tm_mday = parse_2digit(p + 5);
	tm.tm_mon = parse_month_name(s.substr(8, 3));
	tm.tm_year = parse_4digit(p + 12);

	if (tm.tm_sec < 0 || tm.tm_sec > 60 ||
	    tm.tm_min < 0 || tm.tm_min > 59 ||
	    tm.tm_hour < 0 || tm.tm_hour > 23 ||
	    tm.tm_mday < 1 || tm.tm_mday > 31 ||
	    tm.tm_mon < 0 || tm.tm_year < 1900)
		return error;

	tm.tm_year -= 1900;
	tm.tm_isdst = 0;

	return std::chrono::system_clock::from_time_t(timegm(&tm));
}
