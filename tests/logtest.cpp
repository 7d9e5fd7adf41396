/* SPDX-License-Identifier: LGPL-3.0-or-later */
/* Copyright 2016, Kopano and its licensors */
#include <memory>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <zlib.h>
#include <filedav/platform.h>
#include <filedav/davcodes.h>
#include <filedav/FDLogger.h>

using namespace FD;

static int fails;

static void ck_true(const char *label, bool v)
{
	if (v)
		return;
	fprintf(stderr, "%s: failed\n", label);
	++fails;
}

static std::string slurp(const std::string &path)
{
	std::string out;
	char buf[4096];
	auto gz = gzopen(path.c_str(), "rb");
	if (gz == nullptr)
		return out;
	int len;
	while ((len = gzread(gz, buf, sizeof(buf))) > 0)
		out.append(buf, len);
	gzclose(gz);
	return out;
}

static bool contains(const std::string &hay, const char *needle)
{
	return hay.find(needle) != std::string::npos;
}

static void test_file(const std::string &dir)
{
	auto path = dir + "/filedav.log";
	auto lg = std::make_shared<FDLogger_File>(FD_LOGLEVEL_NOTICE, false, path);
	ck_true("not stderr", !lg->IsStdErr());
	fd_log_set(lg);
	fd_log_notice("upload of %s", "a.txt");
	fd_log_debug("too verbose");
	fd_log(FD_LOGLEVEL_ALWAYS, "always there");
	auto hr = fd_perror("Rename failed", FDERR_NO_ACCESS);
	ck_true("perror code", hr == FDERR_NO_ACCESS);

	lg->SetLoglevel(FD_LOGLEVEL_NONE);
	fd_log_crit("silenced");
	fd_log_set(nullptr);
	lg.reset();

	/* gzread passes plain files through */
	auto text = slurp(path);
	ck_true("notice", contains(text, "[notice] upload of a.txt\n"));
	ck_true("level filter", !contains(text, "too verbose"));
	ck_true("always", contains(text, "always there"));
	ck_true("perror text", contains(text, "[error] Rename failed: no access (80000003)"));
	ck_true("none", !contains(text, "silenced"));
	unlink(path.c_str());
}

static void test_gzip_reopen(const std::string &dir)
{
	auto path = dir + "/filedav.log.gz";
	auto moved = dir + "/filedav.log.1.gz";
	{
		FDLogger_File lg(FD_LOGLEVEL_INFO, true, path);
		lg.SetThreadPrefix(true);
		lg.log(FD_LOGLEVEL_INFO, "before rotate");
		ck_true("rename", rename(path.c_str(), moved.c_str()) == 0);
		lg.Reset();
		lg.log(FD_LOGLEVEL_WARNING, "after rotate");
		lg.log(FD_LOGLEVEL_DEBUG, "not logged");
	}

	auto old_text = slurp(moved);
	ck_true("compressed", contains(old_text, "before rotate"));
	ck_true("thread prefix", contains(old_text, "|T") || contains(old_text, "[T"));
	ck_true("timestamp", old_text.size() > 4 && old_text[4] == '-');
	auto new_text = slurp(path);
	ck_true("reopened", contains(new_text, "after rotate") && !contains(new_text, "before"));
	ck_true("level", !contains(new_text, "not logged"));
	unlink(path.c_str());
	unlink(moved.c_str());
}

static void test_bad_file()
{
	FDLogger_File lg(FD_LOGLEVEL_WARNING, false, "/nonexistent/dir/filedav.log");
	ck_true("stderr fallback", lg.IsStdErr());
}

int main(void)
{
	char tmpl[] = "/tmp/logtest-XXXXXX";
	if (mkdtemp(tmpl) == nullptr) {
		perror("mkdtemp");
		return EXIT_FAILURE;
	}
	test_file(tmpl);
	test_gzip_reopen(tmpl);
	test_bad_file();
	rmdir(tmpl);
	return fails == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
