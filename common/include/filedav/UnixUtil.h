/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FD_UNIXUTIL_H
#define FD_UNIXUTIL_H

#include <filedav/fddefs.h>

namespace FD {

class FDConfig;

/* Process setup for the daemon. All return 0 on success, <0 on error. */
extern FD_EXPORT int unix_runas(FDConfig *);
extern FD_EXPORT int unix_chown(const char *path, const char *user, const char *group);
extern FD_EXPORT int unix_create_pidfile(FDConfig *, bool force = true);
extern FD_EXPORT int unix_daemonize(FDConfig *);

} /* namespace */

#endif
