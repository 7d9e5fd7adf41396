/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVLOCK_H
#define DAVLOCK_H

#include <map>
#include <mutex>
#include <string>
#include <filedav/fddefs.h>
#include <filedav/platform.h>
#include <filedav/timeutil.hpp>

namespace FD {

enum DavLockScope {
	DAV_LOCK_EXCLUSIVE,
	DAV_LOCK_SHARED,
};

struct DavLockToken {
	std::string strToken;	//!< urn:uuid:...
	std::string strPath;
	DavLockScope ulScope = DAV_LOCK_EXCLUSIVE;
	unsigned int ulTimeout = 0;	//!< seconds granted
	time_point tExpiry;
};

/**
 * Table of lock tokens, at most one per path. Locks are advisory: LOCK is
 * always granted and nothing else checks the table. Clients such as the
 * Finder refuse to write without one, which is all this is for.
 *
 * Expired entries are dropped on the next access to the table.
 */
class FD_EXPORT DavLockManager {
	public:
	DavLockManager(unsigned int default_timeout = 600, unsigned int max_timeout = 3600);
	virtual ~DavLockManager() = default;
	HRESULT HrLock(const std::string &path, const std::string &timeout_hdr,
		const std::string &if_token, DavLockScope, DavLockToken *out, bool *refreshed = nullptr);
	HRESULT HrUnlock(const std::string &path, const std::string &token);
	bool IsLocked(const std::string &path);
	size_t size();
	unsigned int ParseTimeout(const std::string &hdr) const;

	static std::string ParseIfToken(const std::string &hdr);
	static std::string ParseLockTokenHeader(const std::string &hdr);

	protected:
	virtual time_point now() const { return std::chrono::steady_clock::now(); }

	private:
	FD_HIDDEN void Sweep(const time_point &);

	std::mutex m_hMutex;
	std::map<std::string, DavLockToken> m_mapLocks;
	unsigned int m_ulDefaultTimeout, m_ulMaxTimeout;
};

} /* namespace */

#endif
