/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <filedav/stringutil.h>
#include "DavQuirks.h"

namespace FD {

/**
 * The Finder identifies as "WebDAVFS/3.0 (03008000) Darwin/..." or, in
 * older releases, "WebDAVLib/1.3". The Windows redirector sends
 * "Microsoft-WebDAV-MiniRedir/10.0.19045".
 */
DavQuirk DetectQuirk(const DavHeaders &headers)
{
	auto i = headers.find("User-Agent");
	if (i == headers.cend())
		return DAV_QUIRK_NONE;
	const auto &ua = i->second;
	if (fd_starts_with(ua, "WebDAVFS/") || fd_starts_with(ua, "WebDAVLib/"))
		return DAV_QUIRK_MAC_FINDER;
	if (ua.find("Microsoft-WebDAV-MiniRedir") != std::string::npos)
		return DAV_QUIRK_WINDOWS_MINIREDIR;
	return DAV_QUIRK_NONE;
}

} /* namespace */
