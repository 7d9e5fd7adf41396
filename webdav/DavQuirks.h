/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVQUIRKS_H
#define DAVQUIRKS_H

#include <filedav/fddefs.h>
#include "DavRequest.h"

namespace FD {

enum DavQuirk {
	DAV_QUIRK_NONE,
	DAV_QUIRK_MAC_FINDER,
	DAV_QUIRK_WINDOWS_MINIREDIR,
};

/* Which client workarounds apply, judged from the User-Agent. */
extern FD_EXPORT DavQuirk DetectQuirk(const DavHeaders &);

} /* namespace */

#endif
