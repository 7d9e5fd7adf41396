/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <filedav/memory.hpp>
#include <filedav/stringutil.h>
#include "FDConfigImpl.h"

namespace FD {

static const char config_ws[] = " \t\r\n";

/* "512", "64k", "2 m", "1g" */
static bool parse_size(const char *s, unsigned long long *out)
{
	char *end = nullptr;
	auto v = strtoull(s, &end, 10);
	if (end == s)
		return false;
	while (*end == ' ' || *end == '\t')
		++end;
	switch (tolower(*end)) {
	case 'k': v <<= 10; break;
	case 'm': v <<= 20; break;
	case 'g': v <<= 30; break;
	}
	*out = v;
	return true;
}

FDConfigImpl::FDConfigImpl(const configsetting_t *defaults) :
	m_lpDefaults(defaults)
{
	for (auto d = m_lpDefaults; d != nullptr && d->szName != nullptr; ++d)
		m_settings[d->szName].flags = d->ulFlags;
	ApplyDefaults(CFG_SRC_DEFAULT);
}

void FDConfigImpl::ApplyDefaults(config_source src)
{
	for (auto d = m_lpDefaults; d != nullptr && d->szName != nullptr; ++d)
		Set(d->szName, d->szValue != nullptr ? d->szValue : "", src);
}

bool FDConfigImpl::LoadSettings(const char *file, bool ignore_missing)
{
	struct stat sb;
	if (ignore_missing && stat(file, &sb) != 0 && errno == ENOENT)
		return true;
	m_strFile = file;
	auto ret = ReadFile(m_strFile, CFG_SRC_FILE);
	m_seenFiles.clear();
	return ret;
}

/**
 * Takes --name=value arguments as settings. Dashes in the name become
 * underscores. Other arguments are moved behind the options, keeping their
 * order.
 *
 * @return number of option arguments, i.e. index of the first other one
 */
int FDConfigImpl::ParseParams(int argc, char **argv)
{
	std::vector<char *> rest;
	int nopt = 0;

	for (int i = 0; i < argc; ++i) {
		char *arg = argv[i];
		if (arg == nullptr || strncmp(arg, "--", 2) != 0) {
			rest.push_back(arg);
			continue;
		}
		argv[nopt++] = arg;
		auto eq = strchr(arg, '=');
		if (eq == nullptr) {
			m_errors.emplace_back("Commandline option \"" + std::string(arg + 2) + "\" needs a value");
			continue;
		}
		auto name = trim(std::string(arg + 2, eq), config_ws);
		std::replace(name.begin(), name.end(), '-', '_');
		Set(name, trim(eq + 1, config_ws).c_str(), CFG_SRC_CMDLINE);
	}
	std::copy(rest.cbegin(), rest.cend(), argv + nopt);
	return nopt;
}

bool FDConfigImpl::ReloadSettings()
{
	if (m_strFile.empty())
		return false;
	/* keep the current values if the file went away */
	std::unique_ptr<FILE, file_deleter> fp(fopen(m_strFile.c_str(), "r"));
	if (fp == nullptr)
		return false;
	fp.reset();
	/* options removed from the file fall back to their default */
	ApplyDefaults(CFG_SRC_RELOAD);
	auto ret = ReadFile(m_strFile, CFG_SRC_RELOAD);
	m_seenFiles.clear();
	return ret;
}

const char *FDConfigImpl::GetSetting(const char *name)
{
	if (name == nullptr)
		return nullptr;
	auto i = m_settings.find(name);
	return i != m_settings.cend() ? i->second.value.get() : nullptr;
}

const char *FDConfigImpl::GetSetting(const char *name, const char *equal,
    const char *other)
{
	auto value = GetSetting(name);
	if (value == equal || (value != nullptr && equal != nullptr && strcmp(value, equal) == 0))
		return other;
	return value;
}

bool FDConfigImpl::HasErrors()
{
	FD::shared_lock<FD::shared_mutex> lk(m_lock);
	for (const auto &s : m_settings) {
		if (!(s.second.flags & CONFIGSETTING_NONEMPTY) || s.second.value[0] != '\0')
			continue;
		auto msg = "Option \"" + s.first + "\" cannot be empty";
		if (std::find(m_errors.cbegin(), m_errors.cend(), msg) == m_errors.cend())
			m_errors.emplace_back(std::move(msg));
	}
	return !m_errors.empty();
}

bool FDConfigImpl::Set(const std::string &name, const char *value,
    config_source src)
{
	auto i = m_settings.find(name);
	if (i == m_settings.end()) {
		m_errors.emplace_back("Unknown option \"" + name + "\"");
		return true;
	}
	auto &s = i->second;
	if (src == CFG_SRC_RELOAD &&
	    (!(s.flags & CONFIGSETTING_RELOADABLE) || s.from_cmdline))
		return true;

	/* "$VAR" takes the value from the environment */
	if (value[0] == '$') {
		auto env = getenv(value + 1);
		if (env != nullptr)
			value = env;
		else
			m_warnings.emplace_back("\"" + std::string(value + 1) + "\" not found in the environment, using \"" + value + "\" for option \"" + name + "\"");
	}

	char buf[FD_CONFIG_VALUE_MAX];
	if (s.flags & CONFIGSETTING_SIZE) {
		unsigned long long bytes = 0;
		if (!parse_size(value, &bytes)) {
			m_errors.emplace_back("Option \"" + name + "\" must be a size value (number + optional k/m/g multiplier)");
			return false;
		}
		snprintf(buf, sizeof(buf), "%llu", bytes);
	} else {
		fd_strlcpy(buf, value, sizeof(buf));
	}

	std::lock_guard<FD::shared_mutex> lk(m_lock);
	if (src == CFG_SRC_CMDLINE)
		s.from_cmdline = true;
	memcpy(s.value.get(), buf, sizeof(buf));
	return true;
}

bool FDConfigImpl::ReadFile(const std::string &file, config_source src)
{
	std::unique_ptr<char[], cstdlib_deleter> real(realpath(file.c_str(), nullptr));
	if (real == nullptr) {
		m_errors.emplace_back("Cannot open config file \"" + file + "\": " + strerror(errno));
		return false;
	}
	struct stat sb;
	if (stat(real.get(), &sb) != 0 || !S_ISREG(sb.st_mode)) {
		m_errors.emplace_back("Config file \"" + file + "\" is not a regular file");
		return false;
	}
	/* an include loop reads each file once */
	if (!m_seenFiles.emplace(real.get()).second)
		return true;
	std::unique_ptr<FILE, file_deleter> fp(fopen(real.get(), "r"));
	if (fp == nullptr) {
		m_errors.emplace_back("Cannot open config file \"" + file + "\": " + strerror(errno));
		return false;
	}

	/* relative includes resolve against the including file */
	auto prev = std::move(m_strCurrent);
	auto restore = make_scope_success([&]() { m_strCurrent = std::move(prev); });
	m_strCurrent = real.get();

	char line[4096];
	while (fgets(line, sizeof(line), fp.get()) != nullptr) {
		if (line[0] == '#')
			continue;
		if (line[0] == '!') {
			if (!HandleDirective(line, src))
				return false;
			continue;
		}
		auto eq = strchr(line, '=');
		if (eq == nullptr)
			continue;
		auto name = trim(std::string(line, eq), config_ws);
		if (!name.empty())
			Set(name, trim(eq + 1, config_ws).c_str(), src);
	}
	return true;
}

bool FDConfigImpl::HandleDirective(const std::string &line, config_source src)
{
	auto text = trim(line.substr(1), config_ws);
	auto pos = text.find_first_of(" \t");
	auto name = text.substr(0, pos);
	auto arg = pos == std::string::npos ? std::string() : trim(text.substr(pos), config_ws);

	if (name != "include") {
		m_warnings.emplace_back("Unknown directive \"" + name + "\" ignored");
		return true;
	}
	if (arg.empty()) {
		m_warnings.emplace_back("Empty include directive ignored");
		return true;
	}
	if (arg[0] != '/')
		arg = m_strCurrent.substr(0, m_strCurrent.rfind('/') + 1) + arg;
	return ReadFile(arg, src);
}

} /* namespace */
