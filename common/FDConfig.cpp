/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <cstdlib>
#include "FDConfigImpl.h"

namespace FD {

FDConfig *FDConfig::Create(const configsetting_t *defaults)
{
	return new FDConfigImpl(defaults);
}

std::string FDConfig::GetDefaultPath(const char *basename)
{
	const char *dir = getenv("FILEDAV_CONFIG_PATH");
	if (dir == nullptr || *dir == '\0')
		dir = "/etc/filedav";
	std::string path = dir;
	if (basename != nullptr && *basename != '\0')
		path += std::string("/") + basename;
	return path;
}

} /* namespace */
