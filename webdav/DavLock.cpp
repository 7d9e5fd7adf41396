/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <utility>
#include <cstdlib>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/stringutil.h>
#include "DavLock.h"

namespace FD {

DavLockManager::DavLockManager(unsigned int default_timeout, unsigned int max_timeout) :
	m_ulDefaultTimeout(default_timeout == 0 ? 600 : default_timeout),
	m_ulMaxTimeout(max_timeout == 0 ? 3600 : max_timeout)
{
	if (m_ulDefaultTimeout > m_ulMaxTimeout)
		m_ulDefaultTimeout = m_ulMaxTimeout;
}

/**
 * Parses a Timeout header ("Second-600", "Infinite", or a comma-separated
 * list of those). The first usable entry wins; the result is clamped to
 * the configured maximum.
 */
unsigned int DavLockManager::ParseTimeout(const std::string &hdr) const
{
	for (const auto &item : tokenize(hdr, ',', true)) {
		auto t = trim(item, " \t");
		if (strcasecmp(t.c_str(), "Infinite") == 0)
			return m_ulMaxTimeout;
		if (!fd_istarts_with(t, "Second-"))
			continue;
		char *end = nullptr;
		auto secs = strtoul(t.c_str() + 7, &end, 10);
		if (end == t.c_str() + 7 || *end != '\0' || secs == 0)
			continue;
		return secs > m_ulMaxTimeout ? m_ulMaxTimeout : static_cast<unsigned int>(secs);
	}
	return m_ulDefaultTimeout;
}

/**
 * Extracts the first state token from an If header, e.g.
 * `(<urn:uuid:...>)` or `<http://host/a.txt> (<urn:uuid:...>)`.
 * Resource tags and entity tags are skipped.
 */
std::string DavLockManager::ParseIfToken(const std::string &hdr)
{
	size_t pos = 0;
	int depth = 0;

	while (pos < hdr.size()) {
		char c = hdr[pos];
		if (c == '(') {
			++depth;
		} else if (c == ')') {
			--depth;
		} else if (c == '[') {
			/* entity tag */
			auto end = hdr.find(']', pos);
			if (end == std::string::npos)
				break;
			pos = end;
		} else if (c == '<') {
			auto end = hdr.find('>', pos);
			if (end == std::string::npos)
				break;
			if (depth > 0)
				return hdr.substr(pos + 1, end - pos - 1);
			pos = end;
		}
		++pos;
	}
	return {};
}

/* "<urn:uuid:...>" -> "urn:uuid:..." */
std::string DavLockManager::ParseLockTokenHeader(const std::string &hdr)
{
	auto t = trim(hdr, " \t");
	if (t.size() >= 2 && t.front() == '<' && t.back() == '>')
		return t.substr(1, t.size() - 2);
	return t;
}

void DavLockManager::Sweep(const time_point &tnow)
{
	for (auto i = m_mapLocks.begin(); i != m_mapLocks.end(); ) {
		if (i->second.tExpiry > tnow) {
			++i;
			continue;
		}
		fd_log_debug("Lock %s on \"%s\" expired", i->second.strToken.c_str(), i->first.c_str());
		i = m_mapLocks.erase(i);
	}
}

/**
 * Locks a path, or refreshes an existing lock.
 *
 * - Unlocked path: a new token is issued.
 * - Locked, and if_token names the live token: its expiry is extended.
 * - Locked, without a matching token: the live token is returned as-is.
 *
 * @param[in]	path		canonical path of the resource
 * @param[in]	timeout_hdr	value of the Timeout header, may be empty
 * @param[in]	if_token	token from the If header, may be empty
 * @param[in]	scope		requested lock scope
 * @param[out]	out		the live token for the path
 * @param[out]	refreshed	set when an existing lock was extended
 */
HRESULT DavLockManager::HrLock(const std::string &path, const std::string &timeout_hdr,
    const std::string &if_token, DavLockScope scope, DavLockToken *out, bool *refreshed)
{
	auto tnow = now();
	auto timeout = ParseTimeout(timeout_hdr);
	bool bRefresh = false;
	scoped_lock lk(m_hMutex);

	Sweep(tnow);
	auto i = m_mapLocks.find(path);
	if (i == m_mapLocks.end()) {
		DavLockToken tok;
		tok.strToken = "urn:uuid:" + fd_uuid_string();
		tok.strPath = path;
		tok.ulScope = scope;
		tok.ulTimeout = timeout;
		tok.tExpiry = tnow + std::chrono::seconds(timeout);
		i = m_mapLocks.emplace(path, std::move(tok)).first;
		fd_log_debug("Issued lock %s on \"%s\" for %u s", i->second.strToken.c_str(), path.c_str(), timeout);
	} else if (!if_token.empty() && if_token == i->second.strToken) {
		i->second.ulTimeout = timeout;
		i->second.tExpiry = tnow + std::chrono::seconds(timeout);
		bRefresh = true;
		fd_log_debug("Refreshed lock %s on \"%s\" for %u s", if_token.c_str(), path.c_str(), timeout);
	} else {
		fd_log_debug("\"%s\" already locked by %s", path.c_str(), i->second.strToken.c_str());
	}
	if (out != nullptr)
		*out = i->second;
	if (refreshed != nullptr)
		*refreshed = bRefresh;
	return hrSuccess;
}

/**
 * @retval FDERR_CONFLICT	no live lock on path, or a different token
 */
HRESULT DavLockManager::HrUnlock(const std::string &path, const std::string &token)
{
	scoped_lock lk(m_hMutex);

	Sweep(now());
	auto i = m_mapLocks.find(path);
	if (i == m_mapLocks.end() || i->second.strToken != token)
		return FDERR_CONFLICT;
	m_mapLocks.erase(i);
	fd_log_debug("Released lock %s on \"%s\"", token.c_str(), path.c_str());
	return hrSuccess;
}

bool DavLockManager::IsLocked(const std::string &path)
{
	scoped_lock lk(m_hMutex);
	Sweep(now());
	return m_mapLocks.find(path) != m_mapLocks.cend();
}

size_t DavLockManager::size()
{
	scoped_lock lk(m_hMutex);
	Sweep(now());
	return m_mapLocks.size();
}

} /* namespace */
