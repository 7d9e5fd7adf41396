/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2016 Kopano and its licensors
 */
#ifndef FD_MEMORY_HPP
#define FD_MEMORY_HPP 1

#include <filedav/fddefs.h>
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <unistd.h>
#include <utility>

namespace FD {

/* For use with std::unique_ptr on malloc'ed memory. */
struct cstdlib_deleter {
	void operator()(void *x) const { free(x); }
};

struct file_deleter {
	void operator()(FILE *f) const { if (f != nullptr) fclose(f); }
};

struct dir_deleter {
	void operator()(DIR *d) const { if (d != nullptr) closedir(d); }
};

/**
 * Runs a function when the enclosing scope is left, unless dismiss() was
 * called. Used for cleanup of plain file descriptors and temp files.
 */
template<typename F> class scope_success FD_FINAL {
	public:
	explicit scope_success(F &&f) : m_func(std::move(f)) {}
	scope_success(scope_success &&o) : m_func(std::move(o.m_func)), m_armed(o.m_armed) { o.m_armed = false; }
	~scope_success() { if (m_armed) m_func(); }
	void dismiss() { m_armed = false; }

	private:
	scope_success(const scope_success &) = delete;
	void operator=(const scope_success &) = delete;
	F m_func;
	bool m_armed = true;
};

template<typename F> inline scope_success<F> make_scope_success(F &&f)
{
	return scope_success<F>(std::forward<F>(f));
}

} /* namespace */

#endif /* FD_MEMORY_HPP */
