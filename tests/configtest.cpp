/* SPDX-License-Identifier: LGPL-3.0-or-later */
/* Copyright 2016, Kopano and its licensors */
#include <memory>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <filedav/platform.h>
#include <filedav/FDConfig.h>

using namespace FD;

static const configsetting_t test_defaults[] = {
	{"upload_directory", "", CONFIGSETTING_NONEMPTY},
	{"allowed_extensions", ""},
	{"lock_timeout", "600"},
	{"max_body_size", "1g", CONFIGSETTING_SIZE | CONFIGSETTING_RELOADABLE},
	{"server_name", "filedav", CONFIGSETTING_RELOADABLE},
	{nullptr, nullptr},
};

static int fails;

static void as(const char *label, const char *actual, const char *exp)
{
	if (actual != nullptr && strcmp(actual, exp) == 0)
		return;
	fprintf(stderr, "%s: \"%s\", but expected \"%s\"\n", label,
		actual != nullptr ? actual : "(null)", exp);
	++fails;
}

static void ck_true(const char *label, bool v)
{
	if (v)
		return;
	fprintf(stderr, "%s: failed\n", label);
	++fails;
}

static bool write_config(const char *path, const char *text)
{
	FILE *fp = fopen(path, "w");
	if (fp == nullptr)
		return false;
	fputs(text, fp);
	return fclose(fp) == 0;
}

static void test_defaults_only()
{
	std::unique_ptr<FDConfig> cfg(FDConfig::Create(test_defaults));
	as("default timeout", cfg->GetSetting("lock_timeout"), "600");
	as("default size", cfg->GetSetting("max_body_size"), "1073741824");
	ck_true("unknown is null", cfg->GetSetting("no_such_option") == nullptr);
	ck_true("missing file ignored", cfg->LoadSettings("/nonexistent/filedav.cfg", true));
	/* upload_directory may not stay empty */
	ck_true("nonempty error", cfg->HasErrors());
}

static void test_file(const std::string &dir)
{
	std::string path = dir + "/filedav.cfg";
	std::string inc = dir + "/extra.cfg";
	ck_true("write", write_config(path.c_str(),
		"# comment\n"
		"upload_directory = /srv/dav files  \n"
		"max_body_size = 2m\n"
		"allowed_extensions\t=\ttxt pdf\n"
		"!include extra.cfg\n"));
	ck_true("write include", write_config(inc.c_str(), "server_name = fs1\n"));

	std::unique_ptr<FDConfig> cfg(FDConfig::Create(test_defaults));
	ck_true("load", cfg->LoadSettings(path.c_str()));
	ck_true("no errors", !cfg->HasErrors());
	as("spaces kept", cfg->GetSetting("upload_directory"), "/srv/dav files");
	as("size suffix", cfg->GetSetting("max_body_size"), "2097152");
	as("tab separated", cfg->GetSetting("allowed_extensions"), "txt pdf");
	as("included", cfg->GetSetting("server_name"), "fs1");
	as("equal/other", cfg->GetSetting("server_name", "fs1", "other"), "other");

	/* command line beats the file, and sticks across a reload */
	char a0[] = "--lock-timeout=30", a1[] = "positional", a2[] = "--server_name=cli";
	char *argv[] = {a0, a1, a2};
	auto first = cfg->ParseParams(3, argv);
	ck_true("positional moved", first == 2 && strcmp(argv[2], "positional") == 0);
	as("cmdline dashes", cfg->GetSetting("lock_timeout"), "30");
	as("cmdline", cfg->GetSetting("server_name"), "cli");

	ck_true("rewrite", write_config(path.c_str(),
		"upload_directory = /srv/other\n"
		"max_body_size = 4k\n"));
	ck_true("reload", cfg->ReloadSettings());
	as("not reloadable", cfg->GetSetting("upload_directory"), "/srv/dav files");
	as("reloaded size", cfg->GetSetting("max_body_size"), "4096");
	as("cmdline sticks", cfg->GetSetting("server_name"), "cli");

	ck_true("write bad", write_config(path.c_str(), "no_such_option = 1\n"));
	std::unique_ptr<FDConfig> bad(FDConfig::Create(test_defaults));
	bad->LoadSettings(path.c_str());
	ck_true("unknown option error", bad->HasErrors());
	unlink(path.c_str());
	unlink(inc.c_str());
}

static void test_env_include(const std::string &dir)
{
	std::string path = dir + "/loop.cfg";
	ck_true("write loop", write_config(path.c_str(),
		"upload_directory = $CONFIGTEST_UPLOAD\n"
		"allowed_extensions = $CONFIGTEST_UNSET_VAR\n"
		"!include loop.cfg\n"
		"!frobnicate\n"));
	setenv("CONFIGTEST_UPLOAD", "/srv/env", 1);
	unsetenv("CONFIGTEST_UNSET_VAR");
	std::unique_ptr<FDConfig> cfg(FDConfig::Create(test_defaults));
	ck_true("self include terminates", cfg->LoadSettings(path.c_str()));
	as("env value", cfg->GetSetting("upload_directory"), "/srv/env");
	as("missing env kept", cfg->GetSetting("allowed_extensions"), "$CONFIGTEST_UNSET_VAR");
	/* missing variable plus unknown directive */
	ck_true("warnings", cfg->HasWarnings() && cfg->GetWarnings()->size() == 2);
	ck_true("no errors", !cfg->HasErrors());

	char a0[] = "--max-body-size=lots";
	char *argv[] = {a0};
	cfg->ParseParams(1, argv);
	ck_true("bad size rejected", cfg->HasErrors());
	as("size unchanged", cfg->GetSetting("max_body_size"), "1073741824");
	unlink(path.c_str());

	setenv("FILEDAV_CONFIG_PATH", dir.c_str(), 1);
	as("config path", FDConfig::GetDefaultPath("filedav.cfg").c_str(), (dir + "/filedav.cfg").c_str());
	unsetenv("FILEDAV_CONFIG_PATH");
	as("default config path", FDConfig::GetDefaultPath("filedav.cfg").c_str(), "/etc/filedav/filedav.cfg");
}

int main(void)
{
	char tmpl[] = "/tmp/configtest-XXXXXX";
	if (mkdtemp(tmpl) == nullptr) {
		perror("mkdtemp");
		return EXIT_FAILURE;
	}
	test_defaults_only();
	test_file(tmpl);
	test_env_include(tmpl);
	rmdir(tmpl);
	return fails == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
