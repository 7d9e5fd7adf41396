/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVXML_H
#define DAVXML_H

#include <list>
#include <map>
#include <string>
#include <vector>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

struct _xmlBuffer;
struct _xmlTextWriter;

namespace FD {

#define WEBDAVNS "DAV:"
#define MSDAVNS "urn:schemas-microsoft-com:"

/**
 * Element of a parsed request body. Only element nodes are kept; the
 * character data directly below an element is concatenated into strText.
 */
struct DavXmlElement {
	std::string strNS, strName, strText;
	std::list<DavXmlElement> lstChildren;

	bool is(const char *ns, const char *name) const
	{
		return strNS == ns && strName == name;
	}
	const DavXmlElement *find(const char *ns, const char *name) const;
};

/**
 * Parse a request body. Fails with FDERR_INVALID_PARAMETER when the body
 * is not well-formed XML. Network access and entity expansion are off.
 */
extern FD_EXPORT HRESULT HrParseDavXml(const std::string &body, DavXmlElement *root);

/* &, <, >, " and ' as entities */
extern FD_EXPORT std::string DavXmlEscape(const std::string &);

/**
 * Streaming writer for DAV response documents. Namespaces get a short
 * prefix when first used: DAV: is "D", the Microsoft namespace is "A",
 * anything else counts up from "E".
 */
class FD_EXPORT DavXmlWriter FD_FINAL {
	public:
	DavXmlWriter();
	~DavXmlWriter();
	HRESULT HrStartDocument(const std::string &ns, const std::string &name, const std::vector<std::string> &extra_ns = {});
	HRESULT HrStartElement(const std::string &ns, const std::string &name);
	HRESULT HrWriteElement(const std::string &ns, const std::string &name, const std::string &value);
	HRESULT HrWriteEmptyElement(const std::string &ns, const std::string &name);
	HRESULT HrWriteTree(const DavXmlElement &);
	HRESULT HrEndElement();
	HRESULT HrFinish(std::string *xml);

	private:
	FD_HIDDEN const std::string &RegisterNs(const std::string &ns);
	FD_HIDDEN bool InScope(const std::string &ns) const;
	FD_HIDDEN HRESULT HrOpen(const std::string &ns, const std::string &name);

	struct _xmlBuffer *m_buffer = nullptr;
	struct _xmlTextWriter *m_writer = nullptr;
	std::map<std::string, std::string> m_mapNs;
	/* namespaces declared per open element */
	std::vector<std::vector<std::string>> m_scopes;
	char m_nextPrefix = 'E';

	DavXmlWriter(const DavXmlWriter &) = delete;
	DavXmlWriter &operator=(const DavXmlWriter &) = delete;
};

} /* namespace */

#endif
