/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <vector>
#include <cstdlib>
#include <uuid/uuid.h>
#if defined(__GLIBC__)
#	include <execinfo.h>
#	define WITH_BACKTRACE 1
#endif

namespace FD {

std::vector<std::string> get_backtrace()
{
#define BT_MAX 256
	std::vector<std::string> result;
#ifdef WITH_BACKTRACE
	void *addrlist[BT_MAX];
	int addrlen = backtrace(addrlist, BT_MAX);
	if (addrlen == 0)
		return result;
	char **symbollist = backtrace_symbols(addrlist, addrlen);
	if (symbollist == nullptr)
		return result;
	for (int i = 0; i < addrlen; ++i)
		result.emplace_back(symbollist[i]);
	free(symbollist);
#endif
	return result;
#undef BT_MAX
}

/**
 * Returns a fresh random UUID in its 36-character lowercase text form.
 */
std::string fd_uuid_string()
{
	uuid_t g;
	char buf[37];

	uuid_generate(g);
	uuid_unparse_lower(g, buf);
	return buf;
}

} /* namespace */
