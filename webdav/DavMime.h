/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVMIME_H
#define DAVMIME_H

#include <string>
#include <filedav/fddefs.h>

namespace FD {

#define DAV_MIME_DEFAULT "application/octet-stream"
#define DAV_MIME_DIRECTORY "httpd/unix-directory"

extern FD_EXPORT const char *ext_to_mime_type(const char *ext, const char *def = DAV_MIME_DEFAULT);
/* guess from the extension of the last path component */
extern FD_EXPORT std::string DavGuessMimeType(const std::string &path);

} /* namespace */

#endif
