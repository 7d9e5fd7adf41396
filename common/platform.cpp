/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef _GNU_SOURCE
#	define _GNU_SOURCE 1
#endif
#include <filedav/platform.h>
#include <csignal>
#include <pthread.h>
#include <unistd.h>
#include <sys/syscall.h>

namespace FD {

void set_thread_name(pthread_t tid, const std::string &name)
{
#ifdef __GLIBC__
	/* kernel limit is 16 bytes including the NUL */
	if (name.size() > 15)
		pthread_setname_np(tid, name.substr(0, 15).c_str());
	else
		pthread_setname_np(tid, name.c_str());
#endif
}

/*
 * Worker threads leave INT/HUP/TERM to the main thread, whose poll()
 * must be interrupted by them.
 */
void fdsrv_blocksigs()
{
	sigset_t m;
	sigemptyset(&m);
	sigaddset(&m, SIGINT);
	sigaddset(&m, SIGHUP);
	sigaddset(&m, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &m, nullptr);
}

/*
 * Used for logging only. Can return anything as long as it is unique
 * per thread.
 */
unsigned long fd_threadid()
{
#if defined(__linux__)
	return syscall(SYS_gettid);
#else
	return reinterpret_cast<unsigned long>(pthread_self());
#endif
}

} /* namespace */
