/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FD_TIMEUTIL_HPP
#define FD_TIMEUTIL_HPP 1

#include <chrono>
#include <string>
#include <ctime>
#include <filedav/fddefs.h>

namespace FD {

using time_point = std::chrono::time_point<std::chrono::steady_clock>;

extern FD_EXPORT struct tm *gmtime_safe(time_t, struct tm *);
/* 2018-03-01T12:00:00Z */
extern FD_EXPORT std::string fd_iso8601_time(time_t);
/* Thu, 01 Mar 2018 12:00:00 GMT */
extern FD_EXPORT std::string fd_rfc1123_time(time_t);
/* 01/Mar/2018:12:00:00 +0000, for access logs */
extern FD_EXPORT std::string fd_clf_time(time_t);

} /* namespace */

#endif
