/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FD_PLATFORM_H
#define FD_PLATFORM_H

#include <filedav/fddefs.h>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <pthread.h>
#include <unistd.h>
#include <sys/types.h>

typedef int HRESULT;
typedef unsigned int ULONG;

namespace FD {

extern FD_EXPORT void set_thread_name(pthread_t, const std::string &);
extern FD_EXPORT void fdsrv_blocksigs();
extern FD_EXPORT unsigned long fd_threadid();
extern FD_EXPORT std::vector<std::string> get_backtrace();
extern FD_EXPORT std::string fd_uuid_string();

/* Determine the size of an array */
template<typename T, size_t N> constexpr inline size_t ARRAY_SIZE(T (&)[N]) { return N; }

using shared_mutex = std::shared_mutex;
template<class Mutex> using shared_lock = std::shared_lock<Mutex>;
typedef std::lock_guard<std::mutex> scoped_lock;
typedef std::unique_lock<std::mutex> ulock_normal;

} /* namespace */

#endif // FD_PLATFORM_H
