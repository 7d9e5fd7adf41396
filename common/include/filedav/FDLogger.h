/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FDLOGGER_H
#define FDLOGGER_H

#include <atomic>
#include <cstdarg>
#include <memory>
#include <mutex>
#include <string>
#include <zlib.h>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

namespace FD {

class FDConfig;

/* log_level values of filedav.cfg */
enum {
	FD_LOGLEVEL_NONE = 0,
	FD_LOGLEVEL_CRIT,
	FD_LOGLEVEL_ERROR,
	FD_LOGLEVEL_WARNING,
	FD_LOGLEVEL_NOTICE,
	FD_LOGLEVEL_INFO,
	FD_LOGLEVEL_DEBUG,
	/* bypasses the level check */
	FD_LOGLEVEL_ALWAYS = 0xf,
};

#define FD_LOG_BUFSIZE 10240

/**
 * Destination for log messages. One instance is installed process-wide
 * with fd_log_set; everything else logs through fd_log and the fd_log_*
 * macros.
 */
class FD_EXPORT FDLogger {
	public:
	virtual ~FDLogger();
	bool Log(unsigned int level) const;
	void SetLoglevel(unsigned int level) { m_ulMaxLevel = level; }
	/* Prefix messages with the thread name and id */
	void SetThreadPrefix(bool on) { m_bThreadPrefix = on; }
	/* Reopens the destination, e.g. after logrotate moved it away */
	virtual void Reset() {}
	virtual void log(unsigned int level, const char *msg) = 0;
	void logv(unsigned int level, const char *fmt, va_list);

	protected:
	FDLogger(unsigned int max_level);
	std::string ThreadPrefix() const;

	private:
	std::atomic<unsigned int> m_ulMaxLevel;
	std::atomic<bool> m_bThreadPrefix{false};
};

/**
 * Writes to a file, or to stderr for "-". A name ending in ".gz" is
 * written compressed through zlib.
 */
class FD_EXPORT FDLogger_File FD_FINAL : public FDLogger {
	public:
	FDLogger_File(unsigned int max_level, bool timestamp, const std::string &filename);
	~FDLogger_File();
	/* 0 means line-buffered */
	void SetBufferSize(size_t);
	void Reset() FD_OVERRIDE;
	void log(unsigned int level, const char *msg) FD_OVERRIDE;
	bool IsStdErr() const { return m_strName == "-"; }

	private:
	FD_HIDDEN bool Open();
	FD_HIDDEN void Close();

	std::mutex m_lock;
	std::string m_strName;
	FILE *m_fp = nullptr;
	gzFile m_gz = nullptr;
	bool m_bTimestamp;
	size_t m_ulBufferSize = 0;
};

extern FD_EXPORT void fd_log_set(std::shared_ptr<FDLogger>);
extern FD_EXPORT void fd_log(unsigned int level, const char *fmt, ...) FD_LIKE_PRINTF(2, 3);
extern FD_EXPORT void fd_log(unsigned int level, const std::string &msg);
extern FD_EXPORT HRESULT fd_log_hrcode(HRESULT, unsigned int level, const char *fmt);

#define fd_log_crit(...)    fd_log(FD_LOGLEVEL_CRIT, __VA_ARGS__)
#define fd_log_err(...)     fd_log(FD_LOGLEVEL_ERROR, __VA_ARGS__)
#define fd_log_warn(...)    fd_log(FD_LOGLEVEL_WARNING, __VA_ARGS__)
#define fd_log_notice(...)  fd_log(FD_LOGLEVEL_NOTICE, __VA_ARGS__)
#define fd_log_info(...)    fd_log(FD_LOGLEVEL_INFO, __VA_ARGS__)
#define fd_log_debug(...)   fd_log(FD_LOGLEVEL_DEBUG, __VA_ARGS__)
/* logs "text: message (code)" at error level and yields the code */
#define fd_perror(s, r)     fd_log_hrcode((r), FD_LOGLEVEL_ERROR, s ": %s (%x)")

extern FD_EXPORT std::shared_ptr<FDLogger> CreateLogger(FDConfig *, const char *argv0);
extern FD_EXPORT void LogConfigErrors(FDConfig *);
extern FD_EXPORT void fd_setup_segv_handler(const char *app, const char *vers);
extern FD_EXPORT const std::string &fd_os_pretty_name();

} /* namespace */

#endif /* FDLOGGER_H */
