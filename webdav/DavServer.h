/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVSERVER_H
#define DAVSERVER_H

#include <memory>
#include <string>
#include <filedav/fddefs.h>
#include <filedav/platform.h>
#include "DavDelegate.h"
#include "DavLock.h"
#include "DavSecurity.h"

namespace FD {

class FDConfig;

/**
 * State shared by all requests: the upload directory and its security
 * gate, the lock table and the notification queue. One instance lives for
 * the lifetime of the daemon; per-request work is done by WebDav.
 */
class FD_EXPORT DavServer FD_FINAL {
	public:
	DavServer(const std::string &root, const std::string &extensions,
		bool allow_hidden, std::shared_ptr<DavDelegate>,
		unsigned int lock_timeout = 600, unsigned int lock_max_timeout = 3600);
	HRESULT HrInit();
	static HRESULT Create(FDConfig *, std::shared_ptr<DavDelegate>, std::unique_ptr<DavServer> *);

	const DavSecurity &security() const { return m_security; }
	DavLockManager &locks() { return m_locks; }
	DavNotifier &notifier() { return m_notifier; }
	DavDelegate *delegate() const { return m_notifier.delegate(); }

	private:
	DavSecurity m_security;
	DavLockManager m_locks;
	DavNotifier m_notifier;
};

} /* namespace */

#endif
