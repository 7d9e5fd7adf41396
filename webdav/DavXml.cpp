/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <climits>
#include <string>
#include <utility>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlwriter.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/stringutil.h>
#include "DavXml.h"

namespace FD {

const DavXmlElement *DavXmlElement::find(const char *ns, const char *name) const
{
	for (const auto &c : lstChildren)
		if (c.is(ns, name))
			return &c;
	return nullptr;
}

static void xml_to_element(const xmlNode *node, DavXmlElement *elem)
{
	elem->strName = reinterpret_cast<const char *>(node->name);
	if (node->ns != nullptr && node->ns->href != nullptr)
		elem->strNS = reinterpret_cast<const char *>(node->ns->href);
	for (auto child = node->children; child != nullptr; child = child->next) {
		if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
			if (child->content != nullptr)
				elem->strText += reinterpret_cast<const char *>(child->content);
			continue;
		}
		if (child->type != XML_ELEMENT_NODE)
			continue;
		elem->lstChildren.emplace_back();
		xml_to_element(child, &elem->lstChildren.back());
	}
}

/**
 * Parses the body of a PROPFIND or LOCK request into a DavXmlElement tree.
 *
 * @param[in]	strBody	request body
 * @param[out]	lpRoot	document element
 *
 * @return	HRESULT
 * @retval	FDERR_INVALID_PARAMETER	body is not well-formed
 */
HRESULT HrParseDavXml(const std::string &strBody, DavXmlElement *lpRoot)
{
	if (strBody.size() > INT_MAX)
		return FDERR_TOO_BIG;
	auto doc = xmlReadMemory(strBody.c_str(), static_cast<int>(strBody.size()),
	           "request.xml", nullptr, XML_PARSE_NONET | XML_PARSE_NOBLANKS |
	           XML_PARSE_COMPACT | XML_PARSE_NOWARNING | XML_PARSE_NOERROR);
	if (doc == nullptr) {
		fd_log_debug("Request body is not well-formed XML");
		return FDERR_INVALID_PARAMETER;
	}
	auto node = xmlDocGetRootElement(doc);
	if (node == nullptr) {
		xmlFreeDoc(doc);
		return FDERR_INVALID_PARAMETER;
	}
	*lpRoot = DavXmlElement();
	xml_to_element(node, lpRoot);
	xmlFreeDoc(doc);
	return hrSuccess;
}

std::string DavXmlEscape(const std::string &in)
{
	std::string out;
	out.reserve(in.size());
	for (auto c : in) {
		switch (c) {
		case '&': out += "&amp;"; break;
		case '<': out += "&lt;"; break;
		case '>': out += "&gt;"; break;
		case '"': out += "&quot;"; break;
		case '\'': out += "&apos;"; break;
		default: out += c; break;
		}
	}
	return out;
}

DavXmlWriter::DavXmlWriter()
{
	m_buffer = xmlBufferCreate();
	if (m_buffer == nullptr)
		return;
	m_writer = xmlNewTextWriterMemory(m_buffer, 0);
}

DavXmlWriter::~DavXmlWriter()
{
	if (m_writer != nullptr)
		xmlFreeTextWriter(m_writer);
	if (m_buffer != nullptr)
		xmlBufferFree(m_buffer);
}

/**
 * Returns the prefix for a namespace, assigning the next free one if the
 * namespace was not seen before.
 */
const std::string &DavXmlWriter::RegisterNs(const std::string &strNs)
{
	auto i = m_mapNs.find(strNs);
	if (i != m_mapNs.cend())
		return i->second;
	std::string prefix;
	if (strNs == WEBDAVNS)
		prefix = "D";
	else if (strNs == MSDAVNS)
		prefix = "A";
	else if (m_nextPrefix <= 'Z')
		prefix.assign(1, m_nextPrefix++);
	else
		prefix = "ns" + stringify(m_mapNs.size());
	return m_mapNs.emplace(strNs, std::move(prefix)).first->second;
}

bool DavXmlWriter::InScope(const std::string &strNs) const
{
	for (const auto &scope : m_scopes)
		for (const auto &ns : scope)
			if (ns == strNs)
				return true;
	return false;
}

HRESULT DavXmlWriter::HrOpen(const std::string &strNs, const std::string &strName)
{
	int ret;

	if (strNs.empty()) {
		ret = xmlTextWriterStartElement(m_writer, reinterpret_cast<const xmlChar *>(strName.c_str()));
		m_scopes.emplace_back();
		return ret < 0 ? FDERR_CALL_FAILED : hrSuccess;
	}
	const auto &prefix = RegisterNs(strNs);
	if (InScope(strNs)) {
		ret = xmlTextWriterStartElementNS(m_writer,
		      reinterpret_cast<const xmlChar *>(prefix.c_str()),
		      reinterpret_cast<const xmlChar *>(strName.c_str()), nullptr);
		m_scopes.emplace_back();
	} else {
		/* first use below the root: declare it here */
		ret = xmlTextWriterStartElementNS(m_writer,
		      reinterpret_cast<const xmlChar *>(prefix.c_str()),
		      reinterpret_cast<const xmlChar *>(strName.c_str()),
		      reinterpret_cast<const xmlChar *>(strNs.c_str()));
		m_scopes.emplace_back(1, strNs);
	}
	return ret < 0 ? FDERR_CALL_FAILED : hrSuccess;
}

/**
 * Starts the document with its root element, and declares the extra
 * namespaces on it so that they need not be repeated further down.
 */
HRESULT DavXmlWriter::HrStartDocument(const std::string &strNs,
    const std::string &strName, const std::vector<std::string> &extra_ns)
{
	if (m_writer == nullptr) {
		fd_log_err("Error allocating memory for the XML writer");
		return FDERR_NOT_ENOUGH_MEMORY;
	}
	/* Finder and iCal.app do better with indented output */
	if (xmlTextWriterSetIndent(m_writer, 1) < 0 ||
	    xmlTextWriterStartDocument(m_writer, nullptr, "UTF-8", nullptr) < 0)
		return FDERR_CALL_FAILED;
	auto hr = HrOpen(strNs, strName);
	if (hr != hrSuccess)
		return hr;
	for (const auto &ns : extra_ns) {
		if (ns.empty() || InScope(ns))
			continue;
		auto attr = "xmlns:" + RegisterNs(ns);
		if (xmlTextWriterWriteAttribute(m_writer,
		    reinterpret_cast<const xmlChar *>(attr.c_str()),
		    reinterpret_cast<const xmlChar *>(ns.c_str())) < 0)
			return FDERR_CALL_FAILED;
		m_scopes.back().emplace_back(ns);
	}
	return hrSuccess;
}

HRESULT DavXmlWriter::HrStartElement(const std::string &strNs, const std::string &strName)
{
	if (m_writer == nullptr || m_scopes.empty())
		return FDERR_NOT_INITIALIZED;
	return HrOpen(strNs, strName);
}

HRESULT DavXmlWriter::HrEndElement()
{
	if (m_writer == nullptr || m_scopes.empty())
		return FDERR_NOT_INITIALIZED;
	m_scopes.pop_back();
	return xmlTextWriterEndElement(m_writer) < 0 ? FDERR_CALL_FAILED : hrSuccess;
}

/**
 * Writes <prefix:name>value</prefix:name>. The value is escaped here,
 * quotes included, and then written as-is.
 */
HRESULT DavXmlWriter::HrWriteElement(const std::string &strNs,
    const std::string &strName, const std::string &strValue)
{
	auto hr = HrStartElement(strNs, strName);
	if (hr != hrSuccess)
		return hr;
	if (!strValue.empty() &&
	    xmlTextWriterWriteRaw(m_writer, reinterpret_cast<const xmlChar *>(DavXmlEscape(strValue).c_str())) < 0)
		return FDERR_CALL_FAILED;
	return HrEndElement();
}

HRESULT DavXmlWriter::HrWriteEmptyElement(const std::string &strNs, const std::string &strName)
{
	auto hr = HrStartElement(strNs, strName);
	if (hr != hrSuccess)
		return hr;
	return HrEndElement();
}

/**
 * Writes a parsed element back out, e.g. the <owner> of a lock request.
 */
HRESULT DavXmlWriter::HrWriteTree(const DavXmlElement &elem)
{
	if (elem.lstChildren.empty())
		return HrWriteElement(elem.strNS, elem.strName, elem.strText);
	auto hr = HrStartElement(elem.strNS, elem.strName);
	if (hr != hrSuccess)
		return hr;
	for (const auto &child : elem.lstChildren) {
		hr = HrWriteTree(child);
		if (hr != hrSuccess)
			return hr;
	}
	return HrEndElement();
}

HRESULT DavXmlWriter::HrFinish(std::string *strXml)
{
	if (m_writer == nullptr)
		return FDERR_NOT_INITIALIZED;
	if (xmlTextWriterEndDocument(m_writer) < 0 ||
	    xmlTextWriterFlush(m_writer) < 0) {
		fd_log_err("Error writing xml data");
		return FDERR_CALL_FAILED;
	}
	m_scopes.clear();
	strXml->assign(reinterpret_cast<const char *>(xmlBufferContent(m_buffer)), xmlBufferLength(m_buffer));
	return hrSuccess;
}

} /* namespace */
