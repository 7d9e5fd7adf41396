/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FDCONFIG_H
#define FDCONFIG_H

#include <filedav/fddefs.h>
#include <list>
#include <string>

namespace FD {

/* One row of a defaults table; the table ends with a null szName. */
struct configsetting_t {
	const char *szName, *szValue;
	unsigned int ulFlags;
#define CONFIGSETTING_RELOADABLE	0x0001
#define CONFIGSETTING_NONEMPTY		0x0002
/* number with an optional k/m/g suffix, stored as bytes */
#define CONFIGSETTING_SIZE			0x0004
};

/**
 * Settings of filedav.cfg. The defaults table fixes the set of known
 * options; a config file or the command line can only change their
 * values. Pointers returned by GetSetting stay valid for the lifetime of
 * the object, also across ReloadSettings.
 */
class FD_EXPORT FDConfig {
	public:
	static FDConfig *Create(const configsetting_t *defaults);
	/* $FILEDAV_CONFIG_PATH/<basename>, or /etc/filedav/<basename> */
	static std::string GetDefaultPath(const char *basename);
	virtual ~FDConfig() = default;
	virtual bool LoadSettings(const char *file, bool ignore_missing = false) = 0;
	/* Applies --name=value options; returns the number of arguments left */
	virtual int ParseParams(int argc, char **argv) = 0;
	/* Rereads the file; only reloadable options change */
	virtual bool ReloadSettings() = 0;
	virtual const char *GetSetting(const char *name) = 0;
	virtual const char *GetSetting(const char *name, const char *equal, const char *other) = 0;
	virtual bool HasWarnings() = 0;
	virtual const std::list<std::string> *GetWarnings() = 0;
	virtual bool HasErrors() = 0;
	virtual const std::list<std::string> *GetErrors() = 0;
};

} /* namespace */

#endif /* FDCONFIG_H */
