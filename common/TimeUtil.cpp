/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <filedav/timeutil.hpp>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace FD {

/* strftime's %a and %b follow LC_TIME; HTTP dates must not */
static const char wkday[7][4] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
static const char month[12][4] = {
	"Jan", "Feb", "Mar", "Apr", "May", "Jun",
	"Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

struct tm *gmtime_safe(time_t t, struct tm *result)
{
	auto tmp = gmtime_r(&t, result);
	if (tmp == nullptr)
		memset(result, 0, sizeof(struct tm));
	return tmp;
}

std::string fd_iso8601_time(time_t t)
{
	struct tm tm;
	char buf[32];

	gmtime_safe(t, &tm);
	strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
	return buf;
}

std::string fd_rfc1123_time(time_t t)
{
	struct tm tm;
	char buf[40];

	gmtime_safe(t, &tm);
	snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
	         wkday[tm.tm_wday % 7], tm.tm_mday, month[tm.tm_mon % 12],
	         tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
	return buf;
}

std::string fd_clf_time(time_t t)
{
	struct tm tm;
	char buf[40];

	gmtime_safe(t, &tm);
	snprintf(buf, sizeof(buf), "%02d/%s/%04d:%02d:%02d:%02d +0000",
	         tm.tm_mday, month[tm.tm_mon % 12], tm.tm_year + 1900,
	         tm.tm_hour, tm.tm_min, tm.tm_sec);
	return buf;
}

} /* namespace */
