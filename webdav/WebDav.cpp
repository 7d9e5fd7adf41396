/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <utility>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/fileutil.hpp>
#include <filedav/memory.hpp>
#include <filedav/stringutil.h>
#include <filedav/timeutil.hpp>
#include "WebDav.h"
#include "DavDelegate.h"
#include "DavLock.h"
#include "DavMime.h"
#include "DavProps.h"
#include "DavQuirks.h"
#include "DavSecurity.h"
#include "DavServer.h"
#include "DavStorage.h"
#include "DavXml.h"

namespace FD {

WebDav::WebDav(DavServer &srv, const DavRequest &req, DavResponse *resp) :
	m_server(srv), m_req(req), m_resp(resp)
{}

/**
 * Calls the handler for the request method. Handlers set the status on
 * success; any error they return is turned into the matching status here.
 * 409 and 412, and errors for which the handler named a DAV precondition,
 * get a DAV:error body.
 *
 * @return	result of the handler
 * @retval	FDERR_NOT_IMPLEMENTED	method is not a supported one
 */
HRESULT WebDav::HrHandleCommand()
{
	HRESULT hr;
	const auto &method = m_req.strMethod;

	if (method == "OPTIONS")
		hr = HrOptions();
	else if (method == "GET")
		hr = HrGet(false);
	else if (method == "HEAD")
		hr = HrGet(true);
	else if (method == "PUT")
		hr = HrPut();
	else if (method == "DELETE")
		hr = HrDelete();
	else if (method == "MKCOL")
		hr = HrMkcol();
	else if (method == "COPY")
		hr = HrCopyMove(false);
	else if (method == "MOVE")
		hr = HrCopyMove(true);
	else if (method == "PROPFIND")
		hr = HrPropfind();
	else if (method == "LOCK")
		hr = HrLock();
	else if (method == "UNLOCK")
		hr = HrUnlock();
	else
		hr = FDERR_NOT_IMPLEMENTED;

	if (hr != hrSuccess) {
		fd_log_debug("%s \"%s\": %s (%x)", method.c_str(), m_req.strPath.c_str(), GetErrorMessage(hr), hr);
		*m_resp = DavResponse();
		m_resp->HrToHTTPCode(hr);
		if (m_resp->ulCode == 409 || m_resp->ulCode == 412 ||
		    m_lpszCondition != nullptr) {
			auto ret = HrWriteError();
			if (ret != hrSuccess)
				fd_perror("Unable to write error body", ret);
		}
	} else if (m_resp->ulCode == 0) {
		m_resp->HrToHTTPCode(hr);
	}
	return hr;
}

/**
 * Writes a DAV:error body, e.g.
 *
 * <D:error xmlns:D="DAV:"><D:propfind-finite-depth/></D:error>
 *
 * The condition element is left out when the handler did not set one.
 */
HRESULT WebDav::HrWriteError()
{
	DavXmlWriter xml;
	std::string strXml;

	auto hr = xml.HrStartDocument(WEBDAVNS, "error");
	if (hr == hrSuccess && m_lpszCondition != nullptr)
		hr = xml.HrWriteEmptyElement(WEBDAVNS, m_lpszCondition);
	if (hr == hrSuccess)
		hr = xml.HrFinish(&strXml);
	if (hr != hrSuccess)
		return hr;
	m_resp->HrResponseHeader("Content-Type", DAV_XML_CONTENT_TYPE);
	return m_resp->HrResponseBody(strXml);
}

HRESULT WebDav::HrOptions()
{
	auto quirk = DetectQuirk(m_req.mapHeaders);

	m_resp->HrResponseHeader(200, "OK");
	m_resp->HrResponseHeader("Allow", DAV_ALLOWED_METHODS);
	/* only clients known to need LOCK get to see class 2 */
	m_resp->HrResponseHeader("DAV", quirk == DAV_QUIRK_NONE ? "1" : "1, 2");
	if (quirk == DAV_QUIRK_WINDOWS_MINIREDIR)
		m_resp->HrResponseHeader("MS-Author-Via", "DAV");
	return hrSuccess;
}

HRESULT WebDav::HrGet(bool head)
{
	std::string fspath;
	DavResource res;

	auto hr = m_server.security().HrAuthorize(m_req.strPath, &fspath);
	if (hr != hrSuccess)
		return hr;
	hr = HrStatResource(fspath, &res);
	if (hr != hrSuccess)
		return hr;
	m_resp->HrResponseHeader(200, "OK");
	m_resp->HrResponseHeader("Last-Modified", fd_rfc1123_time(res.tModified));
	if (res.bCollection)
		return hrSuccess;
	m_resp->HrResponseHeader("Content-Type", DavGuessMimeType(fspath));
	m_resp->strFile = fspath;
	m_resp->ullFileSize = res.ullSize;
	if (!head)
		m_server.notifier().post(DAV_EVENT_DOWNLOAD, fspath);
	return hrSuccess;
}

/**
 * Moves the uploaded body over the destination file. The body has been
 * spooled to a temp file already; for bodies that came in memory one is
 * made here. The temp file is removed on every failure.
 *
 * @retval FDERR_NOT_ALLOWED	target is a collection
 * @retval FDERR_CONFLICT	parent collection does not exist
 * @retval FDERR_NO_ACCESS	path rejected or upload vetoed
 */
HRESULT WebDav::HrPut()
{
	std::string fspath, tmpfile = m_req.strTempFile;
	bool existed = false, coll = false;
	auto cleanup = make_scope_success([&]() {
		if (!tmpfile.empty() && unlink(tmpfile.c_str()) != 0 && errno != ENOENT)
			fd_log_warn("Could not remove temp file \"%s\": %s", tmpfile.c_str(), strerror(errno));
	});

	auto hr = m_server.security().HrAuthorize(m_req.strPath, &fspath);
	if (hr != hrSuccess)
		return hr;
	if (!m_req.strPath.empty() && m_req.strPath.back() == '/')
		return FDERR_NOT_ALLOWED;
	existed = DavExists(fspath, &coll);
	if (coll)
		return FDERR_NOT_ALLOWED;
	hr = HrCheckParent(fspath);
	if (hr != hrSuccess)
		return hr;
	if (tmpfile.empty()) {
		/* beside the destination, so the final rename stays on one filesystem */
		hr = HrCreateTempFile(fspath.substr(0, fspath.rfind('/')), m_req.strBody, &tmpfile);
		if (hr != hrSuccess)
			return fd_perror("Unable to store upload", hr);
	}
	if (!m_server.delegate()->shouldUploadFileAtPath(fspath, tmpfile)) {
		fd_log_notice("Upload to \"%s\" refused", fspath.c_str());
		return FDERR_NO_ACCESS;
	}
	hr = HrRenameItem(tmpfile, fspath);
	if (hr != hrSuccess)
		return fd_perror("Unable to move upload into place", hr);
	cleanup.dismiss();

	m_server.notifier().post(DAV_EVENT_UPLOAD, fspath);
	if (existed)
		return m_resp->HrResponseHeader(204, "No Content");
	return m_resp->HrResponseHeader(201, "Created");
}

HRESULT WebDav::HrDelete()
{
	std::string fspath, strDepth;

	if (tokenize(m_req.strPath, '/', true).empty())
		return FDERR_NO_ACCESS;
	if (m_req.HrGetHeaderValue("Depth", &strDepth) == hrSuccess &&
	    strcasecmp(trim(strDepth, " \t").c_str(), "infinity") != 0)
		return FDERR_INVALID_PARAMETER;
	auto hr = m_server.security().HrAuthorize(m_req.strPath, &fspath);
	if (hr != hrSuccess)
		return hr;
	if (m_server.security().IsRoot(fspath))
		return FDERR_NO_ACCESS;
	if (!DavExists(fspath))
		return FDERR_NOT_FOUND;
	if (!m_server.delegate()->shouldDeleteItemAtPath(fspath)) {
		fd_log_notice("Deletion of \"%s\" refused", fspath.c_str());
		return FDERR_NO_ACCESS;
	}
	hr = HrRemoveTree(fspath);
	if (hr != hrSuccess)
		return fd_perror("Unable to delete item", hr);
	m_server.notifier().post(DAV_EVENT_DELETE, fspath);
	return m_resp->HrResponseHeader(204, "No Content");
}

HRESULT WebDav::HrMkcol()
{
	std::string fspath;

	/* no extended MKCOL */
	if (!m_req.strBody.empty() || !m_req.strTempFile.empty())
		return FDERR_BAD_MEDIA;
	auto hr = m_server.security().HrAuthorize(m_req.strPath, &fspath, true);
	if (hr != hrSuccess)
		return hr;
	if (DavExists(fspath))
		return FDERR_NOT_ALLOWED;
	hr = HrCheckParent(fspath);
	if (hr != hrSuccess)
		return hr;
	if (!m_server.delegate()->shouldCreateDirectoryAtPath(fspath)) {
		fd_log_notice("Creation of directory \"%s\" refused", fspath.c_str());
		return FDERR_NO_ACCESS;
	}
	hr = HrMakeDirectory(fspath);
	if (hr == FDERR_COLLISION)
		return FDERR_NOT_ALLOWED;
	if (hr != hrSuccess)
		return fd_perror("Unable to create directory", hr);
	m_server.notifier().post(DAV_EVENT_MKCOL, fspath);
	return m_resp->HrResponseHeader(201, "Created");
}

/**
 * Returns the decoded path from the Destination header, e.g.
 *
 * Destination: http://server:8080/sub/a%20b.txt
 *
 * @retval FDERR_INVALID_PARAMETER	header missing or malformed, or it
 *					names another host
 */
HRESULT WebDav::HrGetDestination(std::string *davpath)
{
	std::string strDest, strHost;

	if (m_req.HrGetHeaderValue("Destination", &strDest) != hrSuccess) {
		fd_log_debug("Destination header missing");
		return FDERR_INVALID_PARAMETER;
	}
	strDest = trim(strDest, " \t");
	size_t pos = std::string::npos;
	if (fd_istarts_with(strDest, "http://"))
		pos = 7;
	else if (fd_istarts_with(strDest, "https://"))
		pos = 8;
	if (pos != std::string::npos) {
		auto slash = strDest.find('/', pos);
		auto authority = strDest.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
		if (m_req.HrGetHeaderValue("Host", &strHost) == hrSuccess &&
		    strcasecmp(trim(strHost, " \t").c_str(), authority.c_str()) != 0) {
			fd_log_err("Refusing to copy or move \"%s\" to different host on url %s", m_req.strPath.c_str(), strDest.c_str());
			return FDERR_INVALID_PARAMETER;
		}
		strDest = slash == std::string::npos ? "/" : strDest.substr(slash);
	} else if (strDest.empty() || strDest[0] != '/') {
		return FDERR_INVALID_PARAMETER;
	}
	auto q = strDest.find_first_of("?#");
	if (q != std::string::npos)
		strDest.erase(q);
	*davpath = urlDecode(strDest);
	return hrSuccess;
}

HRESULT WebDav::HrGetOverwrite(bool *overwrite)
{
	std::string strOver;

	*overwrite = true;
	if (m_req.HrGetHeaderValue("Overwrite", &strOver) != hrSuccess)
		return hrSuccess;
	strOver = trim(strOver, " \t");
	if (strcasecmp(strOver.c_str(), "T") == 0)
		return hrSuccess;
	if (strcasecmp(strOver.c_str(), "F") == 0) {
		*overwrite = false;
		return hrSuccess;
	}
	return FDERR_INVALID_PARAMETER;
}

/**
 * COPY and MOVE. Nothing is changed until all checks passed and the
 * delegate agreed; only then is an existing destination removed.
 *
 * @retval FDERR_INVALID_PARAMETER	bad Depth, Overwrite or Destination
 * @retval FDERR_NO_ACCESS		a path was rejected, source and
 *					destination overlap, or vetoed
 * @retval FDERR_NOT_FOUND		source does not exist
 * @retval FDERR_CONFLICT		destination parent does not exist
 * @retval FDERR_PRECONDITION		destination exists, Overwrite: F
 */
HRESULT WebDav::HrCopyMove(bool move)
{
	std::string srcpath, dstdav, dstpath;
	DavDepth depth = DAV_DEPTH_INFINITY;
	bool overwrite = true, src_coll = false, dst_coll = false;
	auto &sec = m_server.security();

	auto hr = HrParseDepth(m_req, &depth);
	if (hr != hrSuccess)
		return hr;
	if (depth == DAV_DEPTH_ONE || (move && depth != DAV_DEPTH_INFINITY))
		return FDERR_INVALID_PARAMETER;
	hr = HrGetOverwrite(&overwrite);
	if (hr != hrSuccess)
		return hr;
	hr = HrGetDestination(&dstdav);
	if (hr != hrSuccess)
		return hr;
	hr = sec.HrAuthorize(m_req.strPath, &srcpath);
	if (hr != hrSuccess)
		return hr;
	if (!DavExists(srcpath, &src_coll))
		return FDERR_NOT_FOUND;
	hr = sec.HrAuthorize(dstdav, &dstpath, src_coll);
	if (hr != hrSuccess)
		return hr;
	if (srcpath == dstpath || sec.IsRoot(dstpath) ||
	    (move && sec.IsRoot(srcpath)) ||
	    fd_starts_with(dstpath, srcpath + "/")) {
		fd_log_debug("Refusing %s from \"%s\" to \"%s\"", m_req.strMethod.c_str(), srcpath.c_str(), dstpath.c_str());
		return FDERR_NO_ACCESS;
	}
	hr = HrCheckParent(dstpath);
	if (hr != hrSuccess)
		return hr;
	bool existed = DavExists(dstpath, &dst_coll);
	if (existed && !overwrite)
		return FDERR_PRECONDITION;

	bool allowed = move ?
		m_server.delegate()->shouldMoveItemFromPath(srcpath, dstpath) :
		m_server.delegate()->shouldCopyItemFromPath(srcpath, dstpath);
	if (!allowed) {
		fd_log_notice("%s from \"%s\" to \"%s\" refused", m_req.strMethod.c_str(), srcpath.c_str(), dstpath.c_str());
		return FDERR_NO_ACCESS;
	}
	/* a file replacing a file is swapped in whole; collections are cleared first */
	bool replace = existed && !src_coll && !dst_coll;
	if (existed && !replace) {
		hr = HrRemoveTree(dstpath);
		if (hr != hrSuccess)
			return fd_perror("Unable to remove destination", hr);
	}
	if (move)
		hr = HrRenameItem(srcpath, dstpath);
	else if (src_coll && depth == DAV_DEPTH_ZERO)
		hr = HrMakeDirectory(dstpath);
	else if (replace)
		hr = HrCopyOver(srcpath, dstpath);
	else
		hr = HrCopyTree(srcpath, dstpath);
	if (hr != hrSuccess && move)
		return fd_perror("Unable to move item", hr);
	if (hr != hrSuccess)
		return fd_perror("Unable to copy item", hr);

	m_server.notifier().post(move ? DAV_EVENT_MOVE : DAV_EVENT_COPY, srcpath, dstpath);
	if (existed)
		return m_resp->HrResponseHeader(204, "No Content");
	return m_resp->HrResponseHeader(201, "Created");
}

HRESULT WebDav::HrPropfind()
{
	DavDepth depth;
	DavPropertySet set;
	std::string strXml;

	auto hr = HrParseDepth(m_req, &depth);
	if (hr != hrSuccess)
		return hr;
	if (depth == DAV_DEPTH_INFINITY) {
		fd_log_debug("PROPFIND with Depth infinity on \"%s\" refused", m_req.strPath.c_str());
		m_lpszCondition = "propfind-finite-depth";
		return FDERR_NO_ACCESS;
	}
	hr = HrParsePropfind(m_req.strBody, &set);
	if (hr != hrSuccess)
		return hr;
	hr = DavPropfindWalker(m_server.security()).HrWalk(m_req.strPath, depth, set, &strXml);
	if (hr != hrSuccess)
		return hr;
	m_resp->HrResponseHeader(207, "Multi-Status");
	m_resp->HrResponseHeader("Content-Type", DAV_XML_CONTENT_TYPE);
	return m_resp->HrResponseBody(strXml);
}

static HRESULT write_activelock(DavXmlWriter &xml, const DavLockToken &tok,
    const std::string &depth, const DavXmlElement *owner, const std::string &lockroot)
{
	HRESULT hr = xml.HrStartElement(WEBDAVNS, "lockdiscovery");
	if (hr == hrSuccess)
		hr = xml.HrStartElement(WEBDAVNS, "activelock");
	if (hr == hrSuccess)
		hr = xml.HrStartElement(WEBDAVNS, "locktype");
	if (hr == hrSuccess)
		hr = xml.HrWriteEmptyElement(WEBDAVNS, "write");
	if (hr == hrSuccess)
		hr = xml.HrEndElement();
	if (hr == hrSuccess)
		hr = xml.HrStartElement(WEBDAVNS, "lockscope");
	if (hr == hrSuccess)
		hr = xml.HrWriteEmptyElement(WEBDAVNS, tok.ulScope == DAV_LOCK_SHARED ? "shared" : "exclusive");
	if (hr == hrSuccess)
		hr = xml.HrEndElement();
	if (hr == hrSuccess)
		hr = xml.HrWriteElement(WEBDAVNS, "depth", depth);
	if (hr == hrSuccess && owner != nullptr)
		hr = xml.HrWriteTree(*owner);
	if (hr == hrSuccess)
		hr = xml.HrWriteElement(WEBDAVNS, "timeout", "Second-" + stringify(tok.ulTimeout));
	if (hr == hrSuccess)
		hr = xml.HrStartElement(WEBDAVNS, "locktoken");
	if (hr == hrSuccess)
		hr = xml.HrWriteElement(WEBDAVNS, "href", tok.strToken);
	if (hr == hrSuccess)
		hr = xml.HrEndElement();
	if (hr == hrSuccess)
		hr = xml.HrStartElement(WEBDAVNS, "lockroot");
	if (hr == hrSuccess)
		hr = xml.HrWriteElement(WEBDAVNS, "href", lockroot);
	if (hr == hrSuccess)
		hr = xml.HrEndElement();
	if (hr == hrSuccess)
		hr = xml.HrEndElement();
	if (hr == hrSuccess)
		hr = xml.HrEndElement();
	return hr;
}

/**
 * Creates the empty file a LOCK on a new path leaves behind. The file is
 * made beside the target and only moved there once the delegate agreed.
 */
HRESULT WebDav::HrLockNull(const std::string &fspath)
{
	std::string tmpfile;
	auto hr = HrCreateTempFile(fspath.substr(0, fspath.rfind('/')), std::string(), &tmpfile);
	if (hr != hrSuccess)
		return fd_perror("Unable to create locked resource", hr);
	auto cleanup = make_scope_success([&]() {
		if (unlink(tmpfile.c_str()) != 0 && errno != ENOENT)
			fd_log_warn("Could not remove temp file \"%s\": %s", tmpfile.c_str(), strerror(errno));
	});
	if (!m_server.delegate()->shouldUploadFileAtPath(fspath, tmpfile)) {
		fd_log_notice("Creation of locked resource \"%s\" refused", fspath.c_str());
		return FDERR_NO_ACCESS;
	}
	hr = HrRenameItem(tmpfile, fspath);
	if (hr != hrSuccess)
		return fd_perror("Unable to create locked resource", hr);
	cleanup.dismiss();
	m_server.notifier().post(DAV_EVENT_UPLOAD, fspath);
	return hrSuccess;
}

/**
 * Grants a lock. Locks are advisory, see DavLockManager. A resource that
 * does not exist yet is created empty, which counts as an upload: the
 * delegate is asked first and notified afterwards.
 *
 * @retval FDERR_INVALID_PARAMETER	body is not a DAV:lockinfo
 * @retval FDERR_CONFLICT		parent collection does not exist
 * @retval FDERR_NO_ACCESS		path rejected or creation vetoed
 */
HRESULT WebDav::HrLock()
{
	std::string fspath, strTimeout, strIf, strDepth = "infinity", strXml;
	DavLockScope scope = DAV_LOCK_EXCLUSIVE;
	DavXmlElement lockinfo;
	const DavXmlElement *owner = nullptr;
	DavLockToken tok;
	bool coll = false, created = false;

	auto hr = m_server.security().HrAuthorize(m_req.strPath, &fspath);
	if (hr != hrSuccess)
		return hr;
	if (!trim(m_req.strBody, " \t\r\n").empty()) {
		hr = HrParseDavXml(m_req.strBody, &lockinfo);
		if (hr != hrSuccess)
			return hr;
		if (!lockinfo.is(WEBDAVNS, "lockinfo"))
			return FDERR_INVALID_PARAMETER;
		auto ls = lockinfo.find(WEBDAVNS, "lockscope");
		if (ls != nullptr && ls->find(WEBDAVNS, "shared") != nullptr)
			scope = DAV_LOCK_SHARED;
		owner = lockinfo.find(WEBDAVNS, "owner");
	}
	if (m_req.HrGetHeaderValue("Depth", &strDepth) == hrSuccess &&
	    trim(strDepth, " \t") == "0")
		strDepth = "0";
	else
		strDepth = "infinity";

	if (!DavExists(fspath, &coll)) {
		if (!m_req.strPath.empty() && m_req.strPath.back() == '/')
			return FDERR_CONFLICT;
		hr = HrCheckParent(fspath);
		if (hr != hrSuccess)
			return hr;
		hr = HrLockNull(fspath);
		if (hr != hrSuccess)
			return hr;
		created = true;
	}
	m_req.HrGetHeaderValue("Timeout", &strTimeout);
	if (m_req.HrGetHeaderValue("If", &strIf) == hrSuccess)
		strIf = DavLockManager::ParseIfToken(strIf);
	hr = m_server.locks().HrLock(fspath, strTimeout, strIf, scope, &tok);
	if (hr != hrSuccess)
		return hr;

	DavXmlWriter xml;
	hr = xml.HrStartDocument(WEBDAVNS, "prop");
	if (hr == hrSuccess)
		hr = write_activelock(xml, tok, strDepth, owner, DavHref(m_req.strPath, coll));
	if (hr == hrSuccess)
		hr = xml.HrFinish(&strXml);
	if (hr != hrSuccess)
		return hr;
	if (created)
		m_resp->HrResponseHeader(201, "Created");
	else
		m_resp->HrResponseHeader(200, "OK");
	m_resp->HrResponseHeader("Lock-Token", "<" + tok.strToken + ">");
	m_resp->HrResponseHeader("Content-Type", DAV_XML_CONTENT_TYPE);
	return m_resp->HrResponseBody(strXml);
}

HRESULT WebDav::HrUnlock()
{
	std::string fspath, strToken;

	if (m_req.HrGetHeaderValue("Lock-Token", &strToken) != hrSuccess)
		return FDERR_INVALID_PARAMETER;
	auto hr = m_server.security().HrAuthorize(m_req.strPath, &fspath);
	if (hr != hrSuccess)
		return hr;
	hr = m_server.locks().HrUnlock(fspath, DavLockManager::ParseLockTokenHeader(strToken));
	if (hr == FDERR_CONFLICT)
		m_lpszCondition = "lock-token-matches-request-uri";
	if (hr != hrSuccess)
		return hr;
	return m_resp->HrResponseHeader(204, "No Content");
}

} /* namespace */
