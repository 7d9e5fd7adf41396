/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <filedav/davcodes.h>
#include <filedav/stringutil.h>
#include <string>
#include <cerrno>

namespace FD {

struct ErrorTranslateRecord {
	HRESULT errorCode;
	const char *errorMessage;
};

static const ErrorTranslateRecord ErrorCodes[] = {
	{hrSuccess,               "success"},
	{FDERR_NOT_FOUND,         "not found"},
	{FDERR_NO_ACCESS,         "no access"},
	{FDERR_NETWORK_ERROR,     "network error"},
	{FDERR_COLLISION,         "item already exists"},
	{FDERR_NOT_ENOUGH_MEMORY, "not enough memory"},
	{FDERR_END_OF_SESSION,    "end of session"},
	{FDERR_INVALID_PARAMETER, "missing or invalid argument"},
	{FDERR_BAD_VALUE,         "bad value"},
	{FDERR_NO_SUPPORT,        "action not supported by server"},
	{FDERR_TOO_BIG,           "request too big"},
	{FDERR_NOT_IMPLEMENTED,   "not implemented"},
	{FDERR_NOT_INITIALIZED,   "not initialized"},
	{FDERR_CALL_FAILED,       "call failed"},
	{FDERR_TIMEOUT,           "timeout"},
	{FDERR_USER_CANCEL,       "user canceled operation"},
	{FDERR_CANCEL,            "operation canceled"},
	{FDERR_CONFLICT,          "conflict with existing state"},
	{FDERR_PRECONDITION,      "precondition failed"},
	{FDERR_BAD_MEDIA,         "unsupported media type"},
	{FDERR_NOT_ALLOWED,       "method not allowed"},
};

const char *GetErrorMessage(HRESULT code)
{
	for (const auto &e : ErrorCodes)
		if (e.errorCode == code)
			return e.errorMessage;
	return "unknown error code";
}

HRESULT fd_errno_to_hr(int err)
{
	switch (err) {
	case 0:
		return hrSuccess;
	case ENOENT:
		return FDERR_NOT_FOUND;
	case EACCES:
	case EPERM:
	case EROFS:
		return FDERR_NO_ACCESS;
	case EEXIST:
	case ENOTEMPTY:
		return FDERR_COLLISION;
	case ENOTDIR:
		return FDERR_CONFLICT;
	case ENOMEM:
		return FDERR_NOT_ENOUGH_MEMORY;
	case ENAMETOOLONG:
		return FDERR_TOO_BIG;
	default:
		return FDERR_CALL_FAILED;
	}
}

} /* namespace */
