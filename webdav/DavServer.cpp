/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <filedav/FDConfig.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/stringutil.h>
#include "DavServer.h"

namespace FD {

DavServer::DavServer(const std::string &root, const std::string &extensions,
    bool allow_hidden, std::shared_ptr<DavDelegate> delegate,
    unsigned int lock_timeout, unsigned int lock_max_timeout) :
	m_security(root, extensions, allow_hidden),
	m_locks(lock_timeout, lock_max_timeout),
	m_notifier(std::move(delegate))
{}

HRESULT DavServer::HrInit()
{
	auto hr = m_security.HrInit();
	if (hr != hrSuccess)
		return hr;
	fd_log_info("Serving \"%s\"", m_security.root().c_str());
	return hrSuccess;
}

/**
 * Builds the server from the upload_directory, allowed_extensions,
 * allow_hidden_items, lock_timeout and lock_max_timeout settings.
 */
HRESULT DavServer::Create(FDConfig *cfg, std::shared_ptr<DavDelegate> delegate,
    std::unique_ptr<DavServer> *lppServer)
{
	std::unique_ptr<DavServer> srv(new(std::nothrow) DavServer(
		cfg->GetSetting("upload_directory"),
		cfg->GetSetting("allowed_extensions"),
		parseBool(cfg->GetSetting("allow_hidden_items")),
		std::move(delegate),
		atoui(cfg->GetSetting("lock_timeout")),
		atoui(cfg->GetSetting("lock_max_timeout"))));
	if (srv == nullptr)
		return FDERR_NOT_ENOUGH_MEMORY;
	auto hr = srv->HrInit();
	if (hr != hrSuccess)
		return hr;
	*lppServer = std::move(srv);
	return hrSuccess;
}

} /* namespace */
