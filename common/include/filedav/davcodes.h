/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FD_DAVCODES_H
#define FD_DAVCODES_H 1

#include <filedav/fddefs.h>
#include <filedav/platform.h>
#include <string>

namespace FD {

#define MAKE_FDSCODE(sev,code) ( (((unsigned int)(sev)<<31) | ((unsigned int)(code))) )
#define MAKE_FDERR( err ) (static_cast<HRESULT>(MAKE_FDSCODE( 1, err )))

#define hrSuccess				0
#define FDERR_NOT_FOUND				MAKE_FDERR( 2 )
#define FDERR_NO_ACCESS				MAKE_FDERR( 3 )
#define FDERR_NETWORK_ERROR			MAKE_FDERR( 4 )
#define FDERR_COLLISION				MAKE_FDERR( 8 )
#define FDERR_NOT_ENOUGH_MEMORY			MAKE_FDERR( 14 )
#define FDERR_END_OF_SESSION			MAKE_FDERR( 16 )
#define FDERR_INVALID_PARAMETER			MAKE_FDERR( 20 )
#define FDERR_BAD_VALUE				MAKE_FDERR( 23 )
#define FDERR_NO_SUPPORT			MAKE_FDERR( 24 )
#define FDERR_TOO_BIG				MAKE_FDERR( 25 )
#define FDERR_NOT_IMPLEMENTED			MAKE_FDERR( 31 )
#define FDERR_NOT_INITIALIZED			MAKE_FDERR( 35 )
#define FDERR_CALL_FAILED			MAKE_FDERR( 36 )
#define FDERR_TIMEOUT				MAKE_FDERR( 38 )
#define FDERR_USER_CANCEL			MAKE_FDERR( 45 )
#define FDERR_CANCEL				MAKE_FDERR( 48 )
/* DAV-specific outcomes that have no generic equivalent */
#define FDERR_CONFLICT				MAKE_FDERR( 0x100 )
#define FDERR_PRECONDITION			MAKE_FDERR( 0x101 )
#define FDERR_BAD_MEDIA				MAKE_FDERR( 0x102 )
#define FDERR_NOT_ALLOWED			MAKE_FDERR( 0x103 )

extern FD_EXPORT const char *GetErrorMessage(HRESULT);
extern FD_EXPORT HRESULT fd_errno_to_hr(int);

} /* namespace */

#endif /* FD_DAVCODES_H */
