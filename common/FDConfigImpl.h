/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FDCONFIGIMPL_H
#define FDCONFIGIMPL_H

#include <filedav/fddefs.h>
#include <filedav/platform.h>
#include <filedav/FDConfig.h>
#include <list>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace FD {

#define FD_CONFIG_VALUE_MAX 1024

/* Where a value comes from; decides whether it may replace the current one */
enum config_source {
	CFG_SRC_DEFAULT,
	CFG_SRC_FILE,
	CFG_SRC_RELOAD,
	CFG_SRC_CMDLINE,
};

class FDConfigImpl FD_FINAL : public FDConfig {
	public:
	FDConfigImpl(const configsetting_t *defaults);
	bool LoadSettings(const char *file, bool ignore_missing = false) FD_OVERRIDE;
	int ParseParams(int argc, char **argv) FD_OVERRIDE;
	bool ReloadSettings() FD_OVERRIDE;
	const char *GetSetting(const char *name) FD_OVERRIDE;
	const char *GetSetting(const char *name, const char *equal, const char *other) FD_OVERRIDE;
	bool HasWarnings() FD_OVERRIDE { return !m_warnings.empty(); }
	const std::list<std::string> *GetWarnings() FD_OVERRIDE { return &m_warnings; }
	bool HasErrors() FD_OVERRIDE;
	const std::list<std::string> *GetErrors() FD_OVERRIDE { return &m_errors; }

	private:
	struct setting {
		unsigned int flags = 0;
		bool from_cmdline = false;
		/* fixed buffer, so GetSetting pointers survive a reload */
		std::unique_ptr<char[]> value{new char[FD_CONFIG_VALUE_MAX]()};
	};

	void ApplyDefaults(config_source);
	bool ReadFile(const std::string &file, config_source);
	bool HandleDirective(const std::string &line, config_source);
	bool Set(const std::string &name, const char *value, config_source);

	const configsetting_t *m_lpDefaults;
	std::string m_strFile, m_strCurrent;
	std::set<std::string> m_seenFiles;
	/* the map layout is fixed after construction; values are guarded */
	FD::shared_mutex m_lock;
	std::map<std::string, setting> m_settings;
	std::list<std::string> m_warnings, m_errors;
};

} /* namespace */

#endif /* FDCONFIGIMPL_H */
