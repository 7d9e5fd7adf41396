/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVSTORAGE_H
#define DAVSTORAGE_H

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

namespace FD {

/**
 * A file or directory as found on disk. Built on demand, never cached.
 */
struct DavResource {
	std::string strPath;
	bool bCollection = false;
	uint64_t ullSize = 0;
	time_t tModified = 0;
	time_t tCreated = 0;	//!< birth time where the filesystem has one, else tModified
	bool bWritable = false;
};

/*
 * Plain POSIX storage functions. All paths are canonical filesystem paths
 * that already passed DavSecurity. Errors are errno mapped to HRESULT.
 */
extern FD_EXPORT HRESULT HrStatResource(const std::string &path, DavResource *);
extern FD_EXPORT bool DavExists(const std::string &path, bool *collection = nullptr);
extern FD_EXPORT HRESULT HrCheckParent(const std::string &path);
extern FD_EXPORT HRESULT HrListDirectory(const std::string &path, std::vector<std::string> *names);
extern FD_EXPORT HRESULT HrCopyTree(const std::string &from, const std::string &to);
extern FD_EXPORT HRESULT HrCopyOver(const std::string &from, const std::string &to);
extern FD_EXPORT HRESULT HrRemoveTree(const std::string &path);
extern FD_EXPORT HRESULT HrRenameItem(const std::string &from, const std::string &to);
extern FD_EXPORT HRESULT HrMakeDirectory(const std::string &path);
extern FD_EXPORT HRESULT HrCreateEmptyFile(const std::string &path);
extern FD_EXPORT HRESULT HrCreateTempFile(const std::string &dir, const std::string &data, std::string *path);

} /* namespace */

#endif
