/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <vector>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/stringutil.h>
#include <filedav/timeutil.hpp>
#include "DavProps.h"
#include "DavMime.h"
#include "DavRequest.h"
#include "DavSecurity.h"
#include "DavStorage.h"
#include "DavXml.h"

namespace FD {

static constexpr const struct {
	const char *ns, *name;
	unsigned int bit;
} dav_props[] = {
	{WEBDAVNS, "resourcetype", DAVPROP_RESOURCETYPE},
	{WEBDAVNS, "creationdate", DAVPROP_CREATIONDATE},
	{WEBDAVNS, "getlastmodified", DAVPROP_LASTMODIFIED},
	{WEBDAVNS, "getcontentlength", DAVPROP_CONTENTLENGTH},
	{WEBDAVNS, "getcontenttype", DAVPROP_CONTENTTYPE},
	{WEBDAVNS, "displayname", DAVPROP_DISPLAYNAME},
	{MSDAVNS, "permissions", DAVPROP_PERMISSIONS},
};

/**
 * Reads the Depth header: "0", "1" or "infinity".
 *
 * @param[in]	req	the request
 * @param[out]	depth	parsed depth, or def when the header is absent
 * @param[in]	def	depth to assume without a header
 *
 * @retval FDERR_INVALID_PARAMETER	any other value
 */
HRESULT HrParseDepth(const DavRequest &req, DavDepth *depth, DavDepth def)
{
	std::string strDepth;

	if (req.HrGetHeaderValue("Depth", &strDepth) != hrSuccess) {
		*depth = def;
		return hrSuccess;
	}
	strDepth = trim(strDepth, " \t");
	if (strDepth == "0")
		*depth = DAV_DEPTH_ZERO;
	else if (strDepth == "1")
		*depth = DAV_DEPTH_ONE;
	else if (strcasecmp(strDepth.c_str(), "infinity") == 0)
		*depth = DAV_DEPTH_INFINITY;
	else
		return FDERR_INVALID_PARAMETER;
	return hrSuccess;
}

/**
 * Parses a PROPFIND body. An empty body, or one without allprop, propname
 * or prop, asks for all properties.
 *
 * @retval FDERR_INVALID_PARAMETER	malformed XML, or not a DAV:propfind
 */
HRESULT HrParsePropfind(const std::string &strBody, DavPropertySet *set)
{
	DavXmlElement root;

	*set = DavPropertySet();
	if (trim(strBody, " \t\r\n").empty())
		return hrSuccess;
	auto hr = HrParseDavXml(strBody, &root);
	if (hr != hrSuccess)
		return hr;
	if (!root.is(WEBDAVNS, "propfind")) {
		fd_log_debug("PROPFIND body has root element %s:%s", root.strNS.c_str(), root.strName.c_str());
		return FDERR_INVALID_PARAMETER;
	}
	if (root.find(WEBDAVNS, "propname") != nullptr) {
		set->bNamesOnly = true;
		return hrSuccess;
	}
	if (root.find(WEBDAVNS, "allprop") != nullptr)
		return hrSuccess;
	auto prop = root.find(WEBDAVNS, "prop");
	if (prop == nullptr)
		return hrSuccess;

	set->ulProps = 0;
	for (const auto &p : prop->lstChildren) {
		bool known = false;
		for (const auto &d : dav_props) {
			if (!p.is(d.ns, d.name))
				continue;
			set->ulProps |= d.bit;
			known = true;
			break;
		}
		if (!known)
			set->lstUnknown.emplace_back(DAVPROPNAME{p.strNS, p.strName});
	}
	return hrSuccess;
}

/**
 * Builds the href for a DAV path: each component percent-encoded, and a
 * trailing slash on collections.
 */
std::string DavHref(const std::string &davpath, bool collection)
{
	auto comps = tokenize(davpath, '/', true);
	if (comps.empty())
		return "/";
	auto href = urlEncodePath("/" + fd_join(comps, "/"));
	if (collection)
		href += '/';
	return href;
}

static HRESULT write_value(DavXmlWriter &xml, unsigned int bit,
    const std::string &davpath, const DavResource &res)
{
	switch (bit) {
	case DAVPROP_RESOURCETYPE: {
		if (!res.bCollection)
			return xml.HrWriteEmptyElement(WEBDAVNS, "resourcetype");
		auto hr = xml.HrStartElement(WEBDAVNS, "resourcetype");
		if (hr == hrSuccess)
			hr = xml.HrWriteEmptyElement(WEBDAVNS, "collection");
		if (hr == hrSuccess)
			hr = xml.HrEndElement();
		return hr;
	}
	case DAVPROP_CREATIONDATE:
		return xml.HrWriteElement(WEBDAVNS, "creationdate", fd_iso8601_time(res.tCreated));
	case DAVPROP_LASTMODIFIED:
		return xml.HrWriteElement(WEBDAVNS, "getlastmodified", fd_rfc1123_time(res.tModified));
	case DAVPROP_CONTENTLENGTH:
		return xml.HrWriteElement(WEBDAVNS, "getcontentlength", std::to_string(res.bCollection ? 0 : res.ullSize));
	case DAVPROP_CONTENTTYPE:
		return xml.HrWriteElement(WEBDAVNS, "getcontenttype",
		       res.bCollection ? DAV_MIME_DIRECTORY : DavGuessMimeType(res.strPath));
	case DAVPROP_DISPLAYNAME: {
		auto comps = tokenize(davpath, '/', true);
		std::string name;
		if (!comps.empty())
			name = comps.back();
		else if (res.strPath.rfind('/') != std::string::npos)
			name = res.strPath.substr(res.strPath.rfind('/') + 1);
		return xml.HrWriteElement(WEBDAVNS, "displayname", name);
	}
	case DAVPROP_PERMISSIONS:
		return xml.HrWriteElement(MSDAVNS, "permissions", res.bCollection ? "RW" : "R");
	}
	return FDERR_INVALID_PARAMETER;
}

/**
 * Writes one <D:response> element for a resource. Properties that were
 * asked for but are not known get a separate 404 propstat.
 *
 * @param[in]	xml	writer, positioned inside <D:multistatus>
 * @param[in]	davpath	decoded DAV path of the resource
 * @param[in]	res	the resource
 * @param[in]	set	requested properties
 */
HRESULT HrWriteResourceResponse(DavXmlWriter &xml, const std::string &davpath,
    const DavResource &res, const DavPropertySet &set)
{
	auto hr = xml.HrStartElement(WEBDAVNS, "response");
	if (hr != hrSuccess)
		return hr;
	hr = xml.HrWriteElement(WEBDAVNS, "href", DavHref(davpath, res.bCollection));
	if (hr != hrSuccess)
		return hr;

	if (set.ulProps != 0) {
		hr = xml.HrStartElement(WEBDAVNS, "propstat");
		if (hr == hrSuccess)
			hr = xml.HrStartElement(WEBDAVNS, "prop");
		for (const auto &d : dav_props) {
			if (hr != hrSuccess)
				return hr;
			if (!(set.ulProps & d.bit))
				continue;
			if (set.bNamesOnly)
				hr = xml.HrWriteEmptyElement(d.ns, d.name);
			else
				hr = write_value(xml, d.bit, davpath, res);
		}
		if (hr == hrSuccess)
			hr = xml.HrEndElement();
		if (hr == hrSuccess)
			hr = xml.HrWriteElement(WEBDAVNS, "status", "HTTP/1.1 200 OK");
		if (hr == hrSuccess)
			hr = xml.HrEndElement();
		if (hr != hrSuccess)
			return hr;
	}

	if (!set.lstUnknown.empty()) {
		hr = xml.HrStartElement(WEBDAVNS, "propstat");
		if (hr == hrSuccess)
			hr = xml.HrStartElement(WEBDAVNS, "prop");
		for (const auto &p : set.lstUnknown) {
			if (hr != hrSuccess)
				return hr;
			hr = xml.HrWriteEmptyElement(p.strNS, p.strPropname);
		}
		if (hr == hrSuccess)
			hr = xml.HrEndElement();
		if (hr == hrSuccess)
			hr = xml.HrWriteElement(WEBDAVNS, "status", "HTTP/1.1 404 Not Found");
		if (hr == hrSuccess)
			hr = xml.HrEndElement();
		if (hr != hrSuccess)
			return hr;
	}
	return xml.HrEndElement();
}

/**
 * @param[in]	davpath	decoded request path
 * @param[in]	depth	DAV_DEPTH_ZERO or DAV_DEPTH_ONE
 * @param[in]	set	requested properties
 * @param[out]	strXml	the multistatus document
 *
 * @return	HRESULT
 * @retval	FDERR_NO_ACCESS		path rejected, or Depth infinity
 * @retval	FDERR_NOT_FOUND		resource does not exist
 */
HRESULT DavPropfindWalker::HrWalk(const std::string &davpath, DavDepth depth,
    const DavPropertySet &set, std::string *strXml) const
{
	std::string fspath;
	DavResource res;
	DavXmlWriter xml;

	if (depth == DAV_DEPTH_INFINITY)
		return FDERR_NO_ACCESS;
	auto hr = m_security.HrAuthorize(davpath, &fspath);
	if (hr != hrSuccess)
		return hr;
	hr = HrStatResource(fspath, &res);
	if (hr != hrSuccess)
		return hr;

	hr = xml.HrStartDocument(WEBDAVNS, "multistatus", {MSDAVNS});
	if (hr != hrSuccess)
		return hr;
	hr = HrWriteResourceResponse(xml, davpath, res, set);
	if (hr != hrSuccess)
		return hr;

	if (depth == DAV_DEPTH_ONE && res.bCollection) {
		std::vector<std::string> names;
		hr = HrListDirectory(fspath, &names);
		if (hr != hrSuccess)
			return hr;
		std::string parent = davpath;
		if (parent.empty() || parent.back() != '/')
			parent += '/';
		for (const auto &name : names) {
			std::string childfs;
			DavResource child;
			bool coll = false;

			if (!DavExists(fspath + "/" + name, &coll) ||
			    !m_security.NameAllowed(name, coll) ||
			    m_security.HrAuthorize(parent + name, &childfs) != hrSuccess ||
			    HrStatResource(childfs, &child) != hrSuccess)
				continue;
			hr = HrWriteResourceResponse(xml, parent + name, child, set);
			if (hr != hrSuccess)
				return hr;
		}
	}
	return xml.HrFinish(strXml);
}

} /* namespace */
