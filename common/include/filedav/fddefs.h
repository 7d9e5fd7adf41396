/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */

/*
 *	Definitions used throughout the code
 *
 *	platform.h is never included from header files that are meant to be
 *	consumed by an embedding application. Some definitions still need to
 *	be visible everywhere, and those live here.
 */
#ifndef FDCOMMON_DEFS_H
#define FDCOMMON_DEFS_H 1

#if !defined(__cplusplus) || __cplusplus < 201700L
#	error filedav needs at least C++17
#endif
#define FD_HIDDEN __attribute__((visibility("hidden")))
#define FD_EXPORT __attribute__((visibility("default")))
#define FD_FINAL final
#define FD_OVERRIDE override
#define FD_LIKE_PRINTF(_fmt, _va) __attribute__((format(printf, (_fmt), (_va))))

#define FILEDAV_VERSION "1.0.0"

namespace FD {}

#endif /* FDCOMMON_DEFS_H */
