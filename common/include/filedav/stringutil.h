/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FD_STRINGUTIL_H
#define FD_STRINGUTIL_H 1

#include <iterator>
#include <string>
#include <type_traits>
#include <vector>
#include <strings.h>
#include <filedav/platform.h>
#include <filedav/fddefs.h>

namespace FD {

/* Orders header names without regard to case */
struct strcasecmp_comparison {
	bool operator()(const std::string &a, const std::string &b) const
	{
		return strcasecmp(a.c_str(), b.c_str()) < 0;
	}
};

extern FD_EXPORT std::string strToLower(std::string);

static inline std::string stringify(unsigned int x)
{
	return std::to_string(x);
}

/* Config values; anything but "0", "no" and "false" is true. */
extern FD_EXPORT bool parseBool(const char *);
extern FD_EXPORT unsigned int atoui(const char *);

/* split on one character */
extern FD_EXPORT std::vector<std::string> tokenize(const std::string &, char sep, bool filter_empty = false);
/* split on any of a set of characters; empty fields are dropped */
extern FD_EXPORT std::vector<std::string> tokenize(const std::string &, const char *seps);
extern FD_EXPORT std::string trim(const std::string &input, const std::string &strip = " ");

extern FD_EXPORT std::string urlEncode(const std::string &);
extern FD_EXPORT std::string urlEncodePath(const std::string &);
extern FD_EXPORT std::string urlDecode(const std::string &);

extern FD_EXPORT char *fd_strlcpy(char *dst, const char *src, size_t n);
extern FD_EXPORT bool fd_starts_with(const std::string &, const std::string &);
extern FD_EXPORT bool fd_istarts_with(const std::string &, const std::string &);
extern FD_EXPORT bool fd_ends_with(const std::string &, const std::string &);

template<typename Container> std::string fd_join(const Container &v, const char *sep)
{
	static_assert(std::is_same<typename Container::value_type, std::string>::value,
		"fd_join wants strings");
	std::string s;
	for (auto i = std::cbegin(v); i != std::cend(v); ++i) {
		if (i != std::cbegin(v))
			s += sep;
		s += *i;
	}
	return s;
}

} /* namespace */

#endif
