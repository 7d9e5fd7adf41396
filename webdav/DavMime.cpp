/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <strings.h>
#include "DavMime.h"

namespace FD {

static constexpr const struct {
	const char *ext, *mime_type;
} mime_types[] = {
	{"bin", "application/octet-stream"},
	{"exe", "application/octet-stream"},
	{"ai", "application/postscript"},
	{"eps", "application/postscript"},
	{"ps", "application/postscript"},
	{"pdf", "application/pdf"},
	{"rtf", "application/rtf"},
	{"zip", "application/zip"},
	{"gz", "application/gzip"},
	{"tar", "application/x-tar"},
	{"json", "application/json"},
	{"xml", "application/xml"},
	{"js", "application/javascript"},
	{"epub", "application/epub+zip"},
	{"doc", "application/msword"},
	{"xls", "application/vnd.ms-excel"},
	{"ppt", "application/vnd.ms-powerpoint"},
	{"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
	{"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
	{"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
	{"odt", "application/vnd.oasis.opendocument.text"},
	{"ods", "application/vnd.oasis.opendocument.spreadsheet"},
	{"odp", "application/vnd.oasis.opendocument.presentation"},
	{"wav", "audio/x-wav"},
	{"mid", "audio/x-midi"},
	{"mp3", "audio/mpeg"},
	{"m4a", "audio/mp4"},
	{"ogg", "audio/ogg"},
	{"flac", "audio/flac"},
	{"gif", "image/gif"},
	{"jpg", "image/jpeg"},
	{"jpe", "image/jpeg"},
	{"jpeg", "image/jpeg"},
	{"png", "image/png"},
	{"bmp", "image/x-ms-bmp"},
	{"tif", "image/tiff"},
	{"tiff", "image/tiff"},
	{"svg", "image/svg+xml"},
	{"webp", "image/webp"},
	{"ico", "image/x-icon"},
	{"mpg", "video/mpeg"},
	{"mpeg", "video/mpeg"},
	{"mp4", "video/mp4"},
	{"m4v", "video/mp4"},
	{"webm", "video/webm"},
	{"qt", "video/quicktime"},
	{"mov", "video/quicktime"},
	{"avi", "video/x-msvideo"},
	{"ics", "text/calendar"},
	{"vcf", "text/vcard"},
	{"htm", "text/html"},
	{"html", "text/html"},
	{"css", "text/css"},
	{"csv", "text/csv"},
	{"md", "text/markdown"},
	{"txt", "text/plain"},
};

const char *ext_to_mime_type(const char *ext, const char *def)
{
	for (const auto &elem : mime_types)
		if (strcasecmp(ext, elem.ext) == 0)
			return elem.mime_type;
	return def;
}

std::string DavGuessMimeType(const std::string &path)
{
	auto slash = path.rfind('/');
	auto name = slash == std::string::npos ? path : path.substr(slash + 1);
	auto dot = name.rfind('.');
	if (dot == std::string::npos || dot == 0)
		return DAV_MIME_DEFAULT;
	return ext_to_mime_type(name.c_str() + dot + 1);
}

} /* namespace */
