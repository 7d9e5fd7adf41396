/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVPROPS_H
#define DAVPROPS_H

#include <list>
#include <string>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

namespace FD {

class DavSecurity;
class DavXmlWriter;
struct DavRequest;
struct DavResource;

enum {
	DAVPROP_RESOURCETYPE	= 1 << 0,
	DAVPROP_CREATIONDATE	= 1 << 1,
	DAVPROP_LASTMODIFIED	= 1 << 2,
	DAVPROP_CONTENTLENGTH	= 1 << 3,
	DAVPROP_CONTENTTYPE	= 1 << 4,
	DAVPROP_DISPLAYNAME	= 1 << 5,
	DAVPROP_PERMISSIONS	= 1 << 6,
	DAVPROP_ALL		= 0x7f,
};

struct DAVPROPNAME {
	std::string strNS, strPropname;
};

/**
 * The properties a PROPFIND asked for. Names this server does not know
 * are collected in lstUnknown and answered with 404.
 */
struct DavPropertySet {
	unsigned int ulProps = DAVPROP_ALL;
	bool bNamesOnly = false;	//!< <propname/>: names without values
	std::list<DAVPROPNAME> lstUnknown;
};

enum DavDepth {
	DAV_DEPTH_ZERO,
	DAV_DEPTH_ONE,
	DAV_DEPTH_INFINITY,
};

extern FD_EXPORT HRESULT HrParseDepth(const DavRequest &, DavDepth *, DavDepth def = DAV_DEPTH_INFINITY);
extern FD_EXPORT HRESULT HrParsePropfind(const std::string &body, DavPropertySet *);
extern FD_EXPORT HRESULT HrWriteResourceResponse(DavXmlWriter &, const std::string &davpath,
	const DavResource &, const DavPropertySet &);
extern FD_EXPORT std::string DavHref(const std::string &davpath, bool collection);

/**
 * Produces the multistatus document for a PROPFIND: the resource itself,
 * and for Depth 1 its direct children that pass the security gate.
 */
class FD_EXPORT DavPropfindWalker FD_FINAL {
	public:
	DavPropfindWalker(const DavSecurity &sec) : m_security(sec) {}
	HRESULT HrWalk(const std::string &davpath, DavDepth, const DavPropertySet &, std::string *xml) const;

	private:
	const DavSecurity &m_security;
};

} /* namespace */

#endif
