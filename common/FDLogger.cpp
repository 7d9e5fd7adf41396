/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cerrno>
#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <libgen.h>
#include <pthread.h>
#include <syslog.h>
#include <unistd.h>
#include <zlib.h>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <libHX/map.h>
#include <filedav/davcodes.h>
#include <filedav/FDConfig.h>
#include <filedav/FDLogger.h>
#include <filedav/memory.hpp>
#include <filedav/stringutil.h>
#include <filedav/UnixUtil.h>

namespace FD {

/**
 * Sends messages to syslog(3) under the program name, facility daemon.
 */
class FDLogger_Syslog FD_FINAL : public FDLogger {
	public:
	FDLogger_Syslog(unsigned int max_level, const char *argv0);
	~FDLogger_Syslog();
	void log(unsigned int level, const char *msg) override;

	private:
	std::string m_strIdent; /* openlog keeps the pointer */
};

static const char *const level_names[] = {
	"", "crit", "error", "warning", "notice", "info", "debug",
};

static FDLogger_File fd_log_stderr(FD_LOGLEVEL_WARNING, false, "-");
static std::shared_ptr<FDLogger> fd_log_owner;
static std::atomic<FDLogger *> fd_log_target{&fd_log_stderr};
static std::string fd_program_name = "filedav", fd_program_ver;

FDLogger::FDLogger(unsigned int max_level) :
	m_ulMaxLevel(max_level)
{}

FDLogger::~FDLogger()
{
	FDLogger *self = this;
	fd_log_target.compare_exchange_strong(self, &fd_log_stderr);
}

bool FDLogger::Log(unsigned int level) const
{
	unsigned int max = m_ulMaxLevel;
	if (max == FD_LOGLEVEL_NONE)
		return false;
	return level == FD_LOGLEVEL_ALWAYS || level <= max;
}

std::string FDLogger::ThreadPrefix() const
{
	if (!m_bThreadPrefix)
		return std::string();
	char name[32] = "";
	char buf[64];
	if (pthread_getname_np(pthread_self(), name, sizeof(name)) != 0 || *name == '\0')
		snprintf(buf, sizeof(buf), "[T%lu] ", fd_threadid());
	else
		snprintf(buf, sizeof(buf), "[%s|T%lu] ", name, fd_threadid());
	return buf;
}

void FDLogger::logv(unsigned int level, const char *fmt, va_list ap)
{
	static const char trunc[] = "...(truncated)";
	char buf[FD_LOG_BUFSIZE];

	auto len = vsnprintf(buf, sizeof(buf), fmt, ap);
	if (len >= 0 && static_cast<size_t>(len) >= sizeof(buf))
		strcpy(buf + sizeof(buf) - sizeof(trunc), trunc);
	log(level, buf);
}

FDLogger_File::FDLogger_File(unsigned int max_level, bool timestamp,
    const std::string &filename) :
	FDLogger(max_level), m_strName(filename), m_bTimestamp(timestamp)
{
	if (IsStdErr() || Open())
		return;
	fprintf(stderr, "Unable to open logfile %s: %s. Logging to stderr.\n",
	        m_strName.c_str(), strerror(errno));
	m_strName = "-";
}

FDLogger_File::~FDLogger_File()
{
	Close();
}

bool FDLogger_File::Open()
{
	if (fd_ends_with(m_strName, ".gz")) {
		m_gz = gzopen(m_strName.c_str(), "ab");
		return m_gz != nullptr;
	}
	m_fp = fopen(m_strName.c_str(), "a");
	if (m_fp == nullptr)
		return false;
	setvbuf(m_fp, nullptr, m_ulBufferSize == 0 ? _IOLBF : _IOFBF, m_ulBufferSize);
	return true;
}

void FDLogger_File::Close()
{
	if (m_gz != nullptr)
		gzclose(m_gz);
	if (m_fp != nullptr)
		fclose(m_fp);
	m_gz = nullptr;
	m_fp = nullptr;
}

void FDLogger_File::SetBufferSize(size_t size)
{
	std::lock_guard<std::mutex> lk(m_lock);
	m_ulBufferSize = size;
	if (m_fp != nullptr)
		setvbuf(m_fp, nullptr, size == 0 ? _IOLBF : _IOFBF, size);
}

/* Called on SIGHUP, so that logrotate can move the file away. */
void FDLogger_File::Reset()
{
	std::lock_guard<std::mutex> lk(m_lock);
	if (IsStdErr())
		return;
	Close();
	if (Open())
		return;
	fprintf(stderr, "Unable to reopen logfile %s: %s. Logging to stderr.\n",
	        m_strName.c_str(), strerror(errno));
	m_strName = "-";
}

void FDLogger_File::log(unsigned int level, const char *msg)
{
	if (!Log(level))
		return;

	std::string line;
	if (m_bTimestamp) {
		struct timespec ts;
		struct tm tm;
		char buf[64];
		clock_gettime(CLOCK_REALTIME, &ts);
		localtime_r(&ts.tv_sec, &tm);
		auto len = strftime(buf, sizeof(buf), "%FT%T", &tm);
		snprintf(buf + len, sizeof(buf) - len, ".%06ld: ", ts.tv_nsec / 1000);
		line = buf;
	}
	line += ThreadPrefix();
	line += "[";
	line += level < ARRAY_SIZE(level_names) ? level_names[level] : "=======";
	line += "] ";
	line += msg;
	line += "\n";

	std::lock_guard<std::mutex> lk(m_lock);
	if (m_gz != nullptr) {
		gzwrite(m_gz, line.c_str(), line.size());
		if (level <= FD_LOGLEVEL_WARNING)
			gzflush(m_gz, Z_SYNC_FLUSH);
		return;
	}
	auto fp = m_fp != nullptr ? m_fp : stderr;
	fputs(line.c_str(), fp);
	if (m_ulBufferSize > 0 && level <= FD_LOGLEVEL_WARNING)
		fflush(fp);
}

FDLogger_Syslog::FDLogger_Syslog(unsigned int max_level, const char *argv0) :
	FDLogger(max_level)
{
	std::unique_ptr<char[], cstdlib_deleter> copy(strdup(argv0));
	m_strIdent = copy != nullptr ? basename(copy.get()) : "filedav";
	openlog(m_strIdent.c_str(), LOG_PID, LOG_DAEMON);
}

FDLogger_Syslog::~FDLogger_Syslog()
{
	closelog();
}

void FDLogger_Syslog::log(unsigned int level, const char *msg)
{
	static const int prio[] = {
		LOG_DEBUG, LOG_CRIT, LOG_ERR, LOG_WARNING, LOG_NOTICE, LOG_INFO, LOG_DEBUG,
	};
	if (!Log(level))
		return;
	syslog(level < ARRAY_SIZE(prio) ? prio[level] : LOG_ALERT, "%s%s",
	       ThreadPrefix().c_str(), msg);
}

/**
 * "auto" picks the file when log_file is set. Otherwise it is syslog for
 * a daemon (no terminal, /dev/log present) and stderr for a foreground
 * process.
 */
static std::string resolve_log_method(FDConfig *cfg)
{
	std::string meth = cfg->GetSetting("log_method");
	if (strcasecmp(meth.c_str(), "auto") != 0)
		return strToLower(meth);
	if (*cfg->GetSetting("log_file") != '\0')
		return "file";
	struct stat sb;
	if (isatty(STDERR_FILENO) || stat("/dev/log", &sb) != 0 || !S_ISSOCK(sb.st_mode))
		return "stderr";
	return "syslog";
}

/**
 * Creates the logger the log_* settings ask for. A file that cannot be
 * opened falls back to stderr, so this never fails.
 */
std::shared_ptr<FDLogger> CreateLogger(FDConfig *cfg, const char *argv0)
{
	auto meth = resolve_log_method(cfg);
	auto level = strtoul(cfg->GetSetting("log_level"), nullptr, 0);
	auto tstamp = parseBool(cfg->GetSetting("log_timestamp"));
	std::string file = cfg->GetSetting("log_file");

	if (meth == "syslog")
		return std::make_shared<FDLogger_Syslog>(level, argv0);
	if (meth != "file") {
		if (meth != "stderr")
			fprintf(stderr, "Unknown log_method \"%s\", logging to stderr.\n", meth.c_str());
		file = "-";
	}
	if (file.empty())
		file = "-";
	auto logger = std::make_shared<FDLogger_File>(level, tstamp, file);
	logger->SetBufferSize(strtoul(cfg->GetSetting("log_buffer_size"), nullptr, 0));
	if (logger->IsStdErr())
		return logger;
	/* the file must stay writable after unix_runas drops root */
	if (getuid() != 0)
		return logger;
	auto ret = unix_chown(file.c_str(), cfg->GetSetting("run_as_user"), cfg->GetSetting("run_as_group"));
	if (ret < 0)
		logger->log(FD_LOGLEVEL_WARNING, ("chown " + file + ": " + strerror(-ret)).c_str());
	return logger;
}

void LogConfigErrors(FDConfig *cfg)
{
	if (cfg == nullptr)
		return;
	for (const auto &w : *cfg->GetWarnings())
		fd_log_warn("Config warning: " + w);
	for (const auto &e : *cfg->GetErrors())
		fd_log_crit("Config error: " + e);
}

/*
 * The installed logger is only swapped while the process is single
 * threaded, at startup and at shutdown.
 */
void fd_log_set(std::shared_ptr<FDLogger> logger)
{
	fd_log_target = logger != nullptr ? logger.get() : &fd_log_stderr;
	fd_log_owner = std::move(logger);
}

void fd_log(unsigned int level, const char *fmt, ...)
{
	FDLogger *lg = fd_log_target;
	if (!lg->Log(level))
		return;
	va_list ap;
	va_start(ap, fmt);
	lg->logv(level, fmt, ap);
	va_end(ap);
}

void fd_log(unsigned int level, const std::string &msg)
{
	fd_log_target.load()->log(level, msg.c_str());
}

HRESULT fd_log_hrcode(HRESULT code, unsigned int level, const char *fmt)
{
	fd_log(level, fmt, GetErrorMessage(code), code);
	return code;
}

static void fd_segv_handler(int signr, siginfo_t *si, void *)
{
	struct utsname un;

	fd_log_crit("----------------------------------------------------------------------");
	fd_log_crit("Fatal error detected. Please report all following information.");
	fd_log_crit("%s %s", fd_program_name.c_str(), fd_program_ver.c_str());
	if (uname(&un) == 0)
		fd_log_crit("OS: %s (%s %s %s)", fd_os_pretty_name().c_str(), un.sysname, un.release, un.machine);
	else
		fd_log_crit("OS: %s", fd_os_pretty_name().c_str());
	fd_log_crit("Pid %d caught signal %d (%s), code %d, address %p. Backtrace:",
		getpid(), signr, strsignal(signr), si->si_code, si->si_addr);
	auto bt = get_backtrace();
	for (size_t i = 0; i < bt.size(); ++i)
		fd_log_crit("f%zu. %s", i, bt[i].c_str());
	if (bt.empty())
		fd_log_crit("Backtrace not available");
	/* SA_RESETHAND restored the default action */
	raise(signr);
	_exit(EXIT_FAILURE);
}

void fd_setup_segv_handler(const char *app, const char *app_ver)
{
	static std::unique_ptr<char[]> altstack;
	static const size_t altstack_size = 65536;

	if (app != nullptr)
		fd_program_name = app;
	if (app_ver != nullptr)
		fd_program_ver = app_ver;
	/* no file reads from within the handler */
	fd_os_pretty_name();

	if (altstack == nullptr) {
		altstack.reset(new char[altstack_size]);
		stack_t st{};
		st.ss_sp = altstack.get();
		st.ss_size = altstack_size;
		if (sigaltstack(&st, nullptr) < 0)
			fd_log_err("sigaltstack: %s", strerror(errno));
	}
	struct sigaction act{};
	act.sa_sigaction = fd_segv_handler;
	act.sa_flags = SA_ONSTACK | SA_RESETHAND | SA_SIGINFO;
	sigemptyset(&act.sa_mask);
	sigaction(SIGSEGV, &act, nullptr);
	sigaction(SIGBUS, &act, nullptr);
	sigaction(SIGABRT, &act, nullptr);
}

/**
 * PRETTY_NAME from /etc/os-release, read once.
 */
const std::string &fd_os_pretty_name()
{
	static const std::string name = []() -> std::string {
		auto map = HX_shconfig_map("/etc/os-release");
		if (map == nullptr)
			return "(unknown OS)";
		auto pn = HXmap_get<char *>(map, "PRETTY_NAME");
		std::string ret = pn != nullptr ? pn : "(unknown OS)";
		HXmap_free(map);
		return ret;
	}();
	return name;
}

} /* namespace */
