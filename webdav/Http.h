/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */

#ifndef _HTTP_H_
#define _HTTP_H_

#include <cstdint>
#include <string>
#include <filedav/fddefs.h>
#include <filedav/platform.h>
#include <filedav/FDChannel.h>
#include "DavRequest.h"

#define HTTP_CHUNK_SIZE 65536

namespace FD {

class FDConfig;

/**
 * One HTTP/1.x connection: reads requests into DavRequest values and writes
 * DavResponse values back.
 */
class Http FD_FINAL {
public:
	Http(FDChannel *, FDConfig *);
	~Http();
	HRESULT HrReadHeaders();
	HRESULT HrValidateReq();
	HRESULT HrReadBody();
	HRESULT HrGetHeaderValue(const std::string &strHeader, std::string *strValue) const;
	HRESULT HrGetMethod(std::string *strMethod) const;
	HRESULT ToRequest(DavRequest *);
	HRESULT HrSetKeepAlive(int ulKeepAlive);
	HRESULT HrWriteResponse(const DavResponse &);
	HRESULT HrWriteError(HRESULT);

private:
	FDChannel *m_lpChannel;
	FDConfig *m_lpConfig;

	/* request */
	std::string m_strAction;	//!< full 1st-line
	std::string m_strMethod;	//!< HTTP method, e.g. GET, PROPFIND, etc.
	std::string m_strURL;		//!< original action url
	std::string m_strPath;		//!< decoded url
	std::string m_strHttpVer;
	DavHeaders mapHeaders;
	std::string m_strReqBody;
	std::string m_strTempFile;	//!< spooled PUT body
	int m_tmpfd = -1;
	uint64_t m_ullBodySize = 0, m_ullMaxBody = 0;
	int m_ulKeepAlive = 0;
	bool m_bBodyFailed = false;

	HRESULT HrParseHeaders();
	HRESULT HrStoreBody(const char *data, size_t len);
	HRESULT HrReadFixedBody(uint64_t len);
	HRESULT HrReadChunkedBody();
	HRESULT HrOpenSpool();
	HRESULT HrCloseSpool();
	HRESULT HrSendFile(const std::string &path, uint64_t size);
	bool KeepAlive() const;
};

} /* namespace */

#endif
