/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <new>
#include <string>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <filedav/FDConfig.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/fileutil.hpp>

namespace FD {

static bool is_dir(const std::string &path)
{
	struct stat sb;
	return stat(path.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

/**
 * Reads the rest of @f into @out.
 */
HRESULT HrMapFileToString(FILE *f, std::string *out)
{
	if (f == nullptr || out == nullptr)
		return FDERR_INVALID_PARAMETER;
	out->clear();
	char buf[65536];
	size_t rd;
	while ((rd = fread(buf, 1, sizeof(buf), f)) > 0) {
		try {
			out->append(buf, rd);
		} catch (const std::bad_alloc &) {
			return FDERR_NOT_ENOUGH_MEMORY;
		}
	}
	if (ferror(f)) {
		fd_log_err("HrMapFileToString: %s", strerror(errno));
		return fd_errno_to_hr(errno);
	}
	return hrSuccess;
}

/*
 * read(2)/write(2) until @len bytes are through, EOF or a hard error.
 * Returns the bytes transferred, or -1 if nothing could be.
 */
template<typename Buf, typename IO> static ssize_t io_full(int fd, Buf *data,
    size_t len, IO io)
{
	size_t done = 0;
	while (done < len) {
		auto ret = io(fd, data + done, len - done);
		if (ret < 0 && (errno == EINTR || errno == EAGAIN))
			continue;
		if (ret < 0)
			return done > 0 ? static_cast<ssize_t>(done) : -1;
		if (ret == 0)
			break;
		done += ret;
	}
	return done;
}

ssize_t read_retry(int fd, void *data, size_t len)
{
	return io_full(fd, static_cast<char *>(data), len, ::read);
}

ssize_t write_retry(int fd, const void *data, size_t len)
{
	return io_full(fd, static_cast<const char *>(data), len, ::write);
}

TmpPath TmpPath::instance;

/* $TMP, then $TEMP, if they name a directory; /tmp otherwise */
TmpPath::TmpPath() :
	path("/tmp")
{
	for (auto var : {"TMP", "TEMP"}) {
		auto v = getenv(var);
		if (v != nullptr && *v != '\0' && is_dir(v)) {
			path = v;
			break;
		}
	}
}

/**
 * Switches to the tmp_path setting. An empty setting keeps the current
 * directory; an unusable one is reported and ignored.
 */
bool TmpPath::OverridePath(FDConfig *cfg)
{
	const char *setting = cfg->GetSetting("tmp_path");
	if (setting == nullptr || *setting == '\0')
		return true;
	std::string p = setting;
	while (p.size() > 1 && p.back() == '/')
		p.pop_back();
	if (!is_dir(p)) {
		fd_log_warn("tmp_path \"%s\" is unusable, keeping \"%s\"", setting, path.c_str());
		return false;
	}
	path = std::move(p);
	setenv("TMP", path.c_str(), 1);
	setenv("TEMP", path.c_str(), 1);
	return true;
}

} /* namespace */
