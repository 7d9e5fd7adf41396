/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FD_FILEUTIL_HPP
#define FD_FILEUTIL_HPP 1

#include <string>
#include <cstdio>
#include <sys/types.h>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

namespace FD {

class FDConfig;

class FD_EXPORT TmpPath FD_FINAL {
	private:
	std::string path;

	public:
	FD_HIDDEN TmpPath();
	bool OverridePath(FDConfig *);
	const std::string &getTempPath() const { return path; }
	static TmpPath instance;
};

extern FD_EXPORT HRESULT HrMapFileToString(FILE *f, std::string *buf);
extern FD_EXPORT ssize_t read_retry(int, void *, size_t);
extern FD_EXPORT ssize_t write_retry(int, const void *, size_t);

} /* namespace */

#endif /* FD_FILEUTIL_HPP */
