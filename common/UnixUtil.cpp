/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <filedav/FDConfig.h>
#include <filedav/FDLogger.h>
#include <filedav/UnixUtil.h>
#include <filedav/memory.hpp>

namespace FD {

/* Accepts a name or a numeric id. */
static const struct passwd *lookup_user(const char *user)
{
	char *end;
	auto uid = strtoul(user, &end, 10);
	return *end == '\0' ? getpwuid(uid) : getpwnam(user);
}

static const struct group *lookup_group(const char *group)
{
	char *end;
	auto gid = strtoul(group, &end, 10);
	return *end == '\0' ? getgrgid(gid) : getgrnam(group);
}

/**
 * Switches to run_as_group and run_as_user. Empty settings leave the
 * respective identity alone. The working directory becomes /.
 *
 * @return 0 on success, <0 on error
 */
int unix_runas(FDConfig *cfg)
{
	const char *user = cfg->GetSetting("run_as_user");
	const char *group = cfg->GetSetting("run_as_group");
	const struct passwd *pw = nullptr;
	const struct group *gr = nullptr;

	if (chdir("/") != 0) {
		fd_log_err("chdir /: %s", strerror(errno));
		return -errno;
	}
	if (user != nullptr && *user != '\0' && (pw = lookup_user(user)) == nullptr) {
		fd_log_err("Unknown user \"%s\"", user);
		return -ENOENT;
	}
	if (group != nullptr && *group != '\0' && (gr = lookup_group(group)) == nullptr) {
		fd_log_err("Unknown group \"%s\"", group);
		return -ENOENT;
	}
	if (gr != nullptr && getegid() != gr->gr_gid) {
		if (pw != nullptr && initgroups(pw->pw_name, gr->gr_gid) != 0) {
			fd_log_crit("Changing supplementary groups failed: %s", strerror(errno));
			return -errno;
		}
		if (setgid(gr->gr_gid) != 0) {
			fd_log_crit("Changing to group \"%s\" failed: %s", gr->gr_name, strerror(errno));
			return -errno;
		}
	}
	if (pw != nullptr && geteuid() != pw->pw_uid && setuid(pw->pw_uid) != 0) {
		fd_log_crit("Changing to user \"%s\" failed: %s", pw->pw_name, strerror(errno));
		return -errno;
	}
	return 0;
}

/**
 * Hands a file to user:group. Names that do not resolve keep the current
 * id.
 *
 * @return 0 on success, -errno on error
 */
int unix_chown(const char *path, const char *user, const char *group)
{
	uid_t uid = -1;
	gid_t gid = -1;

	if (user != nullptr && *user != '\0') {
		auto pw = lookup_user(user);
		if (pw != nullptr)
			uid = pw->pw_uid;
	}
	if (group != nullptr && *group != '\0') {
		auto gr = lookup_group(group);
		if (gr != nullptr)
			gid = gr->gr_gid;
	}
	return chown(path, uid, gid) == 0 ? 0 : -errno;
}

/**
 * Writes the pid to pid_file. A pid file naming a live process makes this
 * fail, unless force is set; a stale one is overwritten.
 *
 * @return 0 on success, <0 on error
 */
int unix_create_pidfile(FDConfig *cfg, bool force)
{
	std::string path = cfg->GetSetting("pid_file");
	if (path.empty())
		return 0;

	std::unique_ptr<FILE, file_deleter> fp(fopen(path.c_str(), "r"));
	int oldpid = 0;
	if (fp != nullptr && fscanf(fp.get(), "%d", &oldpid) == 1 &&
	    oldpid > 0 && oldpid != getpid() &&
	    (kill(oldpid, 0) == 0 || errno == EPERM)) {
		fd_log_crit("Process %d from pidfile %s is still running.", oldpid, path.c_str());
		if (!force)
			return -EEXIST;
	}
	fp.reset(fopen(path.c_str(), "w"));
	if (fp == nullptr) {
		fd_log_err("Unable to write pidfile \"%s\": %s", path.c_str(), strerror(errno));
		return -errno;
	}
	fprintf(fp.get(), "%d\n", getpid());
	return 0;
}

/**
 * Forks into the background. The parent exits; the child runs in a new
 * session with stdin and stdout on /dev/null. stderr is kept only when it
 * is where the log goes.
 *
 * @return 0 in the child, <0 on error
 */
int unix_daemonize(FDConfig *cfg)
{
	auto pid = fork();
	if (pid < 0) {
		fd_log_crit("Unable to daemonize: fork: %s", strerror(errno));
		return -errno;
	}
	if (pid > 0)
		_exit(EXIT_SUCCESS);
	if (setsid() < 0)
		fd_log_warn("setsid: %s", strerror(errno));

	int nullfd = open("/dev/null", O_RDWR);
	if (nullfd < 0) {
		fd_log_err("Unable to open /dev/null: %s", strerror(errno));
		return -errno;
	}
	dup2(nullfd, STDIN_FILENO);
	dup2(nullfd, STDOUT_FILENO);
	const char *file = cfg->GetSetting("log_file");
	if (file == nullptr || strcmp(file, "-") != 0)
		dup2(nullfd, STDERR_FILENO);
	if (nullfd > STDERR_FILENO)
		close(nullfd);
	return 0;
}

} /* namespace */
