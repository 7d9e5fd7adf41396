/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <filedav/davcodes.h>
#include <filedav/stringutil.h>
#include "DavRequest.h"

namespace FD {

HRESULT DavRequest::HrGetHeaderValue(const std::string &name, std::string *value) const
{
	auto i = mapHeaders.find(name);
	if (i == mapHeaders.cend())
		return FDERR_NOT_FOUND;
	if (value != nullptr)
		*value = i->second;
	return hrSuccess;
}

/**
 * Sets the status of the response
 * @param[in]	ulCode		HTTP status code
 * @param[in]	strReason	HTTP reason phrase
 *
 * @return		HRESULT
 * @retval		FDERR_CALL_FAILED	The status is already set
 */
HRESULT DavResponse::HrResponseHeader(unsigned int code, const std::string &reason)
{
	if (ulCode != 0)
		return FDERR_CALL_FAILED;
	ulCode = code;
	strReason = reason;
	return hrSuccess;
}

/**
 * Adds a response header to the list of headers
 * @param[in]	strHeader	Name of the header e.g. Lock-Token, DAV
 * @param[in]	strValue	Value of the header to be set
 */
HRESULT DavResponse::HrResponseHeader(const std::string &name, const std::string &value)
{
	lstHeaders.emplace_back(name, value);
	return hrSuccess;
}

HRESULT DavResponse::HrResponseBody(const std::string &body)
{
	strBody += body;
	return hrSuccess;
}

HRESULT DavResponse::HrGetHeaderValue(const std::string &name, std::string *value) const
{
	for (const auto &h : lstHeaders) {
		if (strcasecmp(h.first.c_str(), name.c_str()) != 0)
			continue;
		if (value != nullptr)
			*value = h.second;
		return hrSuccess;
	}
	return FDERR_NOT_FOUND;
}

/**
 * Converts the result of a handler to the HTTP status it stands for.
 *
 * @param hr HRESULT
 *
 * @return Error from HrResponseHeader(unsigned int, string)
 */
HRESULT DavResponse::HrToHTTPCode(HRESULT hr)
{
	switch (hr) {
	case hrSuccess:
		return HrResponseHeader(200, "OK");
	case FDERR_INVALID_PARAMETER:
	case FDERR_BAD_VALUE:
	case FDERR_TOO_BIG:
		return HrResponseHeader(400, "Bad Request");
	case FDERR_NO_ACCESS:
	case FDERR_NO_SUPPORT:
		return HrResponseHeader(403, "Forbidden");
	case FDERR_NOT_FOUND:
		return HrResponseHeader(404, "Not Found");
	case FDERR_NOT_ALLOWED:
	case FDERR_COLLISION:
		return HrResponseHeader(405, "Method Not Allowed");
	case FDERR_CONFLICT:
		return HrResponseHeader(409, "Conflict");
	case FDERR_PRECONDITION:
		return HrResponseHeader(412, "Precondition Failed");
	case FDERR_BAD_MEDIA:
		return HrResponseHeader(415, "Unsupported Media Type");
	case FDERR_NOT_IMPLEMENTED:
		return HrResponseHeader(501, "Not Implemented");
	default:
		return HrResponseHeader(500, "Internal Server Error");
	}
}

} /* namespace */
