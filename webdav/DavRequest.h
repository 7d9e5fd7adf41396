/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVREQUEST_H
#define DAVREQUEST_H

#include <list>
#include <map>
#include <string>
#include <utility>
#include <cstdint>
#include <filedav/fddefs.h>
#include <filedav/platform.h>
#include <filedav/stringutil.h>

namespace FD {

typedef std::map<std::string, std::string, strcasecmp_comparison> DavHeaders;

/**
 * One parsed HTTP request, independent of the connection it came in on.
 * The handlers only ever see this, which lets them be driven from tests
 * without a socket.
 */
struct DavRequest {
	std::string strMethod;
	std::string strPath;		//!< percent-decoded path, e.g. "/sub dir/a.txt"
	std::string strUrl;		//!< request target as sent by the client
	std::string strHttpVer;
	DavHeaders mapHeaders;
	std::string strBody;
	std::string strTempFile;	//!< PUT bodies are spooled here

	HRESULT HrGetHeaderValue(const std::string &name, std::string *value) const;
	bool HasHeader(const std::string &name) const { return mapHeaders.find(name) != mapHeaders.cend(); }
};

/**
 * The response a handler produced. The status line can be set only once.
 * strFile, when set, names a file whose
 * contents are sent as body instead of strBody.
 */
struct DavResponse {
	unsigned int ulCode = 0;
	std::string strReason;
	std::list<std::pair<std::string, std::string>> lstHeaders;
	std::string strBody;
	std::string strFile;
	uint64_t ullFileSize = 0;

	HRESULT HrResponseHeader(unsigned int code, const std::string &reason);
	HRESULT HrResponseHeader(const std::string &name, const std::string &value);
	HRESULT HrResponseBody(const std::string &body);
	HRESULT HrGetHeaderValue(const std::string &name, std::string *value) const;
	HRESULT HrToHTTPCode(HRESULT);
};

} /* namespace */

#endif
