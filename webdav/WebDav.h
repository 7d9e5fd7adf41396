/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef WEBDAV_H
#define WEBDAV_H

#include <string>
#include <filedav/fddefs.h>
#include <filedav/platform.h>
#include "DavRequest.h"

namespace FD {

class DavServer;

#define DAV_ALLOWED_METHODS "OPTIONS, GET, HEAD, PUT, DELETE, MKCOL, COPY, MOVE, PROPFIND, LOCK, UNLOCK"
#define DAV_XML_CONTENT_TYPE "application/xml; charset=\"utf-8\""

/**
 * Handles one WebDAV request against a DavServer. Construct one per
 * request and call HrHandleCommand; the response is always filled in,
 * also when an error is returned.
 */
class FD_EXPORT WebDav FD_FINAL {
	public:
	WebDav(DavServer &, const DavRequest &, DavResponse *);
	HRESULT HrHandleCommand();

	private:
	HRESULT HrOptions();
	HRESULT HrGet(bool head);
	HRESULT HrPut();
	HRESULT HrDelete();
	HRESULT HrMkcol();
	HRESULT HrCopyMove(bool move);
	HRESULT HrPropfind();
	HRESULT HrLock();
	HRESULT HrLockNull(const std::string &fspath);
	HRESULT HrUnlock();
	HRESULT HrWriteError();

	HRESULT HrGetDestination(std::string *davpath);
	HRESULT HrGetOverwrite(bool *overwrite);

	DavServer &m_server;
	const DavRequest &m_req;
	DavResponse *m_resp;
	/* DAV precondition element reported with an error, if any */
	const char *m_lpszCondition = nullptr;
};

} /* namespace */

#endif
