/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <memory>
#include <string>
#include <vector>
#include <cerrno>
#include <climits>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/fileutil.hpp>
#include <filedav/memory.hpp>
#include "DavStorage.h"

namespace FD {

#define DAV_COPY_BUFSIZE 65536

HRESULT HrStatResource(const std::string &path, DavResource *res)
{
	struct stat sb;

	if (stat(path.c_str(), &sb) != 0)
		return fd_errno_to_hr(errno);
	res->strPath = path;
	res->bCollection = S_ISDIR(sb.st_mode);
	res->ullSize = res->bCollection ? 0 : sb.st_size;
	res->tModified = sb.st_mtime;
	res->tCreated = sb.st_mtime;
	res->bWritable = access(path.c_str(), W_OK) == 0;
#ifdef STATX_BTIME
	struct statx sx;
	if (statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME, &sx) == 0 &&
	    (sx.stx_mask & STATX_BTIME))
		res->tCreated = sx.stx_btime.tv_sec;
#endif
	return hrSuccess;
}

bool DavExists(const std::string &path, bool *collection)
{
	struct stat sb;
	if (stat(path.c_str(), &sb) != 0)
		return false;
	if (collection != nullptr)
		*collection = S_ISDIR(sb.st_mode);
	return true;
}

/**
 * @retval FDERR_CONFLICT	the parent of path is missing or not a directory
 */
HRESULT HrCheckParent(const std::string &path)
{
	auto pos = path.rfind('/');
	if (pos == std::string::npos)
		return FDERR_CONFLICT;
	bool coll = false;
	if (!DavExists(pos == 0 ? "/" : path.substr(0, pos), &coll) || !coll)
		return FDERR_CONFLICT;
	return hrSuccess;
}

/**
 * Lists the names in a directory, in the order the filesystem returns
 * them. "." and ".." are left out.
 */
HRESULT HrListDirectory(const std::string &path, std::vector<std::string> *names)
{
	std::unique_ptr<DIR, dir_deleter> dh(opendir(path.c_str()));
	if (dh == nullptr)
		return fd_errno_to_hr(errno);
	names->clear();
	for (;;) {
		errno = 0;
		auto de = readdir(dh.get());
		if (de == nullptr)
			break;
		if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0)
			continue;
		names->emplace_back(de->d_name);
	}
	return errno != 0 ? fd_errno_to_hr(errno) : hrSuccess;
}

static HRESULT copy_data(const std::string &from, int out)
{
	char buf[DAV_COPY_BUFSIZE];
	int in = open(from.c_str(), O_RDONLY | O_CLOEXEC);

	if (in < 0)
		return fd_errno_to_hr(errno);
	for (;;) {
		auto rd = read_retry(in, buf, sizeof(buf));
		if (rd < 0)
			break;
		if (rd == 0) {
			close(in);
			return hrSuccess;
		}
		if (write_retry(out, buf, rd) != rd)
			break;
	}
	auto hr = fd_errno_to_hr(errno);
	close(in);
	return hr;
}

static HRESULT copy_file(const std::string &from, const std::string &to, mode_t mode)
{
	int out = open(to.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode & 07777);
	if (out < 0)
		return fd_errno_to_hr(errno);
	auto hr = copy_data(from, out);
	if (close(out) != 0 && hr == hrSuccess)
		hr = fd_errno_to_hr(errno);
	return hr;
}

/**
 * Recursively copies a file, symlink or directory tree. File modes are
 * preserved; ownership and timestamps are not.
 */
HRESULT HrCopyTree(const std::string &from, const std::string &to)
{
	struct stat sb;

	if (lstat(from.c_str(), &sb) != 0)
		return fd_errno_to_hr(errno);
	if (S_ISLNK(sb.st_mode)) {
		char target[PATH_MAX];
		auto len = readlink(from.c_str(), target, sizeof(target) - 1);
		if (len < 0)
			return fd_errno_to_hr(errno);
		target[len] = '\0';
		if (symlink(target, to.c_str()) != 0)
			return fd_errno_to_hr(errno);
		return hrSuccess;
	}
	if (!S_ISDIR(sb.st_mode))
		return copy_file(from, to, sb.st_mode);

	if (mkdir(to.c_str(), sb.st_mode & 07777) != 0)
		return fd_errno_to_hr(errno);
	std::vector<std::string> names;
	auto hr = HrListDirectory(from, &names);
	if (hr != hrSuccess)
		return hr;
	for (const auto &n : names) {
		hr = HrCopyTree(from + "/" + n, to + "/" + n);
		if (hr != hrSuccess)
			return hr;
	}
	return hrSuccess;
}

/**
 * Removes a file, or a directory with everything below it. Symlinks are
 * removed, never followed.
 */
HRESULT HrRemoveTree(const std::string &path)
{
	struct stat sb;

	if (lstat(path.c_str(), &sb) != 0)
		return fd_errno_to_hr(errno);
	if (!S_ISDIR(sb.st_mode))
		return unlink(path.c_str()) == 0 ? hrSuccess : fd_errno_to_hr(errno);

	std::vector<std::string> names;
	auto hr = HrListDirectory(path, &names);
	if (hr != hrSuccess)
		return hr;
	for (const auto &n : names) {
		hr = HrRemoveTree(path + "/" + n);
		if (hr != hrSuccess)
			return hr;
	}
	return rmdir(path.c_str()) == 0 ? hrSuccess : fd_errno_to_hr(errno);
}

/**
 * Copies from into a new hidden item next to to, so that it can be
 * renamed over to afterwards. On failure, whatever was created is removed
 * again.
 *
 * @param[out]	tmp	name of the copy
 */
static HRESULT copy_beside(const std::string &from, const std::string &to, std::string *tmp)
{
	struct stat sb;
	std::vector<std::string> names;
	HRESULT hr = hrSuccess;
	int fd = -1;

	if (lstat(from.c_str(), &sb) != 0)
		return fd_errno_to_hr(errno);
	auto pos = to.rfind('/');
	std::string name = (pos == std::string::npos ? std::string() : to.substr(0, pos + 1)) + ".filedav-XXXXXX";

	if (S_ISDIR(sb.st_mode)) {
		if (mkdtemp(&name[0]) == nullptr)
			return fd_errno_to_hr(errno);
		if (chmod(name.c_str(), sb.st_mode & 07777) != 0) {
			hr = fd_errno_to_hr(errno);
			goto exit;
		}
		hr = HrListDirectory(from, &names);
		for (size_t i = 0; hr == hrSuccess && i < names.size(); ++i)
			hr = HrCopyTree(from + "/" + names[i], name + "/" + names[i]);
		goto exit;
	}
	fd = mkstemp(&name[0]);
	if (fd < 0)
		return fd_errno_to_hr(errno);
	if (S_ISLNK(sb.st_mode)) {
		/* symlink(2) cannot replace the placeholder */
		close(fd);
		fd = -1;
		if (unlink(name.c_str()) != 0)
			return fd_errno_to_hr(errno);
		hr = HrCopyTree(from, name);
		if (hr != hrSuccess)
			return hr;
		*tmp = std::move(name);
		return hrSuccess;
	}
	if (fchmod(fd, sb.st_mode & 07777) != 0) {
		hr = fd_errno_to_hr(errno);
		goto exit;
	}
	hr = copy_data(from, fd);
	if (close(fd) != 0 && hr == hrSuccess)
		hr = fd_errno_to_hr(errno);
	fd = -1;
 exit:
	if (fd >= 0)
		close(fd);
	if (hr != hrSuccess) {
		if (HrRemoveTree(name) != hrSuccess)
			fd_log_warn("Could not remove partial copy \"%s\"", name.c_str());
		return hr;
	}
	*tmp = std::move(name);
	return hrSuccess;
}

/**
 * Replaces to with a copy of from. The copy is made next to to and then
 * renamed over it, so to is either the old or the new item, never a
 * partial one.
 */
HRESULT HrCopyOver(const std::string &from, const std::string &to)
{
	std::string tmp;
	auto hr = copy_beside(from, to, &tmp);
	if (hr != hrSuccess)
		return hr;
	if (rename(tmp.c_str(), to.c_str()) == 0)
		return hrSuccess;
	hr = fd_errno_to_hr(errno);
	if (HrRemoveTree(tmp) != hrSuccess)
		fd_log_warn("Could not remove partial copy \"%s\"", tmp.c_str());
	return hr;
}

/**
 * Moves an item with rename(2). Across filesystems it falls back to
 * HrCopyOver and removes the source last; a failure there leaves both.
 */
HRESULT HrRenameItem(const std::string &from, const std::string &to)
{
	if (rename(from.c_str(), to.c_str()) == 0)
		return hrSuccess;
	if (errno != EXDEV)
		return fd_errno_to_hr(errno);
	fd_log_debug("\"%s\" and \"%s\" are on different filesystems, copying", from.c_str(), to.c_str());
	auto hr = HrCopyOver(from, to);
	if (hr != hrSuccess)
		return hr;
	return HrRemoveTree(from);
}

HRESULT HrMakeDirectory(const std::string &path)
{
	if (mkdir(path.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != 0)
		return fd_errno_to_hr(errno);
	return hrSuccess;
}

/**
 * Creates an empty file, failing if anything exists at path already.
 */
HRESULT HrCreateEmptyFile(const std::string &path)
{
	int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
	         S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
	if (fd < 0)
		return fd_errno_to_hr(errno);
	close(fd);
	return hrSuccess;
}

/**
 * Writes data to a new uniquely named file in dir.
 *
 * @param[in]	dir	directory to create the file in
 * @param[in]	data	file contents
 * @param[out]	path	name of the created file
 */
HRESULT HrCreateTempFile(const std::string &dir, const std::string &data, std::string *path)
{
	std::string tmpl = dir + "/.filedav-XXXXXX";
	int fd = mkstemp(&tmpl[0]);
	if (fd < 0)
		return fd_errno_to_hr(errno);
	if (fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) != 0)
		fd_log_debug("fchmod %s: %s", tmpl.c_str(), strerror(errno));
	if (write_retry(fd, data.data(), data.size()) != static_cast<ssize_t>(data.size())) {
		auto hr = fd_errno_to_hr(errno);
		close(fd);
		unlink(tmpl.c_str());
		return hr;
	}
	if (close(fd) != 0) {
		auto hr = fd_errno_to_hr(errno);
		unlink(tmpl.c_str());
		return hr;
	}
	*path = std::move(tmpl);
	return hrSuccess;
}

} /* namespace */
