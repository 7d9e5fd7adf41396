/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <string>
#include <utility>
#include <cerrno>
#include <climits>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <filedav/FDConfig.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/fileutil.hpp>
#include <filedav/stringutil.h>
#include <filedav/timeutil.hpp>
#include "Http.h"

namespace FD {

#define HTTP_MAX_HEADERS 256

Http::Http(FDChannel *lpChannel, FDConfig *lpConfig) :
	m_lpChannel(lpChannel), m_lpConfig(lpConfig)
{
	if (m_lpConfig != nullptr) {
		auto s = m_lpConfig->GetSetting("max_body_size");
		if (s != nullptr)
			m_ullMaxBody = strtoull(s, nullptr, 10);
	}
}

Http::~Http()
{
	if (m_tmpfd >= 0)
		close(m_tmpfd);
	/* after a successful PUT the file has been renamed away already */
	if (!m_strTempFile.empty() && unlink(m_strTempFile.c_str()) != 0 && errno != ENOENT)
		fd_log_warn("Could not remove temp file \"%s\": %s", m_strTempFile.c_str(), strerror(errno));
}

/**
 * Reads the http headers from the channel and Parses them
 *
 * @return	HRESULT
 * @retval	FDERR_INVALID_PARAMETER	The http hearders are invalid
 */
HRESULT Http::HrReadHeaders()
{
	HRESULT hr;
	std::string strBuffer;
	ULONG n = 0;
	auto iHeader = mapHeaders.end();

	fd_log_debug("Receiving headers:");
	do
	{
		hr = m_lpChannel->HrReadLine(strBuffer);
		if (hr != hrSuccess)
			return hr;
		if (strBuffer.empty()) {
			/* tolerate empty lines between keep-alive requests */
			if (n == 0)
				continue;
			break;
		}
		if (n > HTTP_MAX_HEADERS)
			return FDERR_TOO_BIG;

		if (n == 0) {
			m_strAction = strBuffer;
		} else if (strBuffer[0] == ' ' || strBuffer[0] == '\t') {
			if (iHeader != mapHeaders.end())
				// continue header
				iHeader->second += " " + trim(strBuffer, " \t");
		} else {
			// new header
			auto pos = strBuffer.find(':');
			if (pos == std::string::npos) {
				fd_log_debug("Ignoring malformed header line");
			} else {
				auto r = mapHeaders.emplace(trim(strBuffer.substr(0, pos), " \t"), trim(strBuffer.substr(pos + 1), " \t"));
				iHeader = r.first;
			}
		}

		if (fd_istarts_with(strBuffer, "Authorization"))
			fd_log_debug("< Authorization: <value hidden>");
		else
			fd_log_debug("< " + strBuffer);
		++n;
	} while(hr == hrSuccess);

	hr = HrParseHeaders();
	if (hr != hrSuccess)
		fd_log_debug("parsing headers failed: %s (%x)", GetErrorMessage(hr), hr);
	return hr;
}

/**
 * Parse the request line. The request target may be in origin form
 * ("/a%20b.txt") or absolute form ("http://host/a%20b.txt"); the query
 * part is dropped.
 *
 * @retval	FDERR_INVALID_PARAMETER	The request line is invalid
 */
HRESULT Http::HrParseHeaders()
{
	auto items = tokenize(m_strAction, ' ', true);
	if (items.size() != 3) {
		fd_log_debug("HrParseHeaders invalid != 3 tokens");
		return FDERR_INVALID_PARAMETER;
	}
	m_strMethod = items[0];
	m_strURL = items[1];
	m_strHttpVer = items[2];
	if (!fd_starts_with(m_strHttpVer, "HTTP/1."))
		return FDERR_INVALID_PARAMETER;

	std::string path = m_strURL;
	if (fd_istarts_with(path, "http://") || fd_istarts_with(path, "https://")) {
		auto slash = path.find('/', path.find("//") + 2);
		path = slash == std::string::npos ? "/" : path.substr(slash);
	}
	auto q = path.find_first_of("?#");
	if (q != std::string::npos)
		path.erase(q);
	if (path.empty() || path[0] != '/')
		path.insert(0, 1, '/');
	// converts %20 -> ' '
	m_strPath = urlDecode(path);
	return hrSuccess;
}

HRESULT Http::HrGetHeaderValue(const std::string &strHeader, std::string *strValue) const
{
	auto iHeader = mapHeaders.find(strHeader);
	if (iHeader == mapHeaders.cend())
		return FDERR_NOT_FOUND;
	strValue->assign(iHeader->second);
	return hrSuccess;
}

/**
 * Returns the method set in the url
 * @param[out]	strMethod	Return string for method set in request
 * @return		HRESULT
 * @retval		FDERR_NOT_FOUND	Empty method in request
 */
HRESULT Http::HrGetMethod(std::string *strMethod) const
{
	if (m_strMethod.empty())
		return FDERR_NOT_FOUND;
	strMethod->assign(m_strMethod);
	return hrSuccess;
}

/**
 * Check for errors in the http request
 * @return		HRESULT
 * @retval		FDERR_NOT_IMPLEMENTED	Unsupported http request
 */
HRESULT Http::HrValidateReq()
{
	static const char *const lpszMethods[] = {
		"OPTIONS", "GET", "HEAD", "PUT", "DELETE", "MKCOL", "COPY",
		"MOVE", "PROPFIND", "LOCK", "UNLOCK", nullptr,
	};

	if (m_strMethod.empty())
		return fd_perror("HTTP request method is empty", FDERR_INVALID_PARAMETER);
	for (unsigned int i = 0; lpszMethods[i] != nullptr; ++i)
		if (m_strMethod.compare(lpszMethods[i]) == 0)
			return hrSuccess;

	static const HRESULT hr = FDERR_NOT_IMPLEMENTED;
	fd_log_err("HTTP request \"%s\" not implemented: %s (%x)", m_strMethod.c_str(), GetErrorMessage(hr), hr);
	return hr;
}

HRESULT Http::HrOpenSpool()
{
	std::string tmpl = TmpPath::instance.getTempPath() + "/filedav-XXXXXX";
	m_tmpfd = mkstemp(&tmpl[0]);
	if (m_tmpfd < 0) {
		fd_log_err("Unable to create temp file in \"%s\": %s", TmpPath::instance.getTempPath().c_str(), strerror(errno));
		return fd_errno_to_hr(errno);
	}
	if (fchmod(m_tmpfd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) != 0)
		fd_log_debug("fchmod %s: %s", tmpl.c_str(), strerror(errno));
	m_strTempFile = std::move(tmpl);
	return hrSuccess;
}

HRESULT Http::HrCloseSpool()
{
	int fd = m_tmpfd;
	m_tmpfd = -1;
	if (close(fd) != 0)
		return fd_errno_to_hr(errno);
	return hrSuccess;
}

HRESULT Http::HrStoreBody(const char *data, size_t len)
{
	m_ullBodySize += len;
	if (m_ullMaxBody != 0 && m_ullBodySize > m_ullMaxBody)
		return FDERR_TOO_BIG;
	if (m_tmpfd < 0) {
		m_strReqBody.append(data, len);
		return hrSuccess;
	}
	if (write_retry(m_tmpfd, data, len) != static_cast<ssize_t>(len))
		return fd_perror("Unable to spool request body", fd_errno_to_hr(errno));
	return hrSuccess;
}

HRESULT Http::HrReadFixedBody(uint64_t len)
{
	std::string buf;

	while (len > 0) {
		size_t part = len > HTTP_CHUNK_SIZE ? HTTP_CHUNK_SIZE : len;
		auto hr = m_lpChannel->HrReadBytes(&buf, part);
		if (hr != hrSuccess)
			return hr;
		hr = HrStoreBody(buf.data(), part);
		if (hr != hrSuccess)
			return hr;
		len -= part;
	}
	return hrSuccess;
}

/**
 * Reads a chunked body:
 * 1A[;ext][CRLF]	- size in hex
 * xxxxxxxxxxxx..[CRLF]	- data
 * 0[CRLF]		- end of body
 * [trailers][CRLF]
 */
HRESULT Http::HrReadChunkedBody()
{
	std::string line;

	while (true) {
		auto hr = m_lpChannel->HrReadLine(line, 1024);
		if (hr != hrSuccess)
			return hr;
		char *end = nullptr;
		auto size = strtoull(line.c_str(), &end, 16);
		if (end == line.c_str() || (*end != '\0' && *end != ';' && *end != ' ')) {
			fd_log_debug("Invalid chunk size line");
			return FDERR_INVALID_PARAMETER;
		}
		if (size == 0)
			break;
		if (m_ullMaxBody != 0 && m_ullBodySize + size > m_ullMaxBody)
			return FDERR_TOO_BIG;
		hr = HrReadFixedBody(size);
		if (hr != hrSuccess)
			return hr;
		hr = m_lpChannel->HrReadLine(line, 1024);
		if (hr != hrSuccess)
			return hr;
		if (!line.empty())
			return FDERR_INVALID_PARAMETER;
	}
	/* skip trailers */
	do {
		auto hr = m_lpChannel->HrReadLine(line, 65536);
		if (hr != hrSuccess)
			return hr;
	} while (!line.empty());
	return hrSuccess;
}

/**
 * Reads request body from the channel, sized by Content-Length or sent
 * chunked. PUT bodies go to a temp file, anything else stays in memory.
 * A missing body is not an error.
 *
 * @return		HRESULT
 * @retval		FDERR_TOO_BIG			body exceeds max_body_size
 * @retval		FDERR_INVALID_PARAMETER		bad Content-Length or chunking
 */
HRESULT Http::HrReadBody()
{
	std::string strLength, strTE, strExpect;
	uint64_t ulContLength = 0;
	bool chunked = false;
	HRESULT hr = hrSuccess;

	if (HrGetHeaderValue("Transfer-Encoding", &strTE) == hrSuccess &&
	    strcasestr(strTE.c_str(), "chunked") != nullptr) {
		chunked = true;
	} else if (HrGetHeaderValue("Content-Length", &strLength) == hrSuccess) {
		char *end = nullptr;
		errno = 0;
		ulContLength = strtoull(strLength.c_str(), &end, 10);
		if (strLength.empty() || !isdigit(static_cast<unsigned char>(strLength[0])) ||
		    *end != '\0' || errno == ERANGE) {
			fd_log_debug("Http::HrReadBody content-length invalid \"%s\"", strLength.c_str());
			m_bBodyFailed = true;
			return FDERR_INVALID_PARAMETER;
		}
		if (m_ullMaxBody != 0 && ulContLength > m_ullMaxBody) {
			fd_log_err("Request body of %llu bytes exceeds max_body_size", static_cast<unsigned long long>(ulContLength));
			m_bBodyFailed = true;
			return FDERR_TOO_BIG;
		}
	}

	if (m_strMethod == "PUT") {
		hr = HrOpenSpool();
		if (hr != hrSuccess) {
			m_bBodyFailed = true;
			return hr;
		}
	}
	if (!chunked && ulContLength == 0)
		goto exit;
	if (HrGetHeaderValue("Expect", &strExpect) == hrSuccess &&
	    strcasecmp(strExpect.c_str(), "100-continue") == 0) {
		hr = m_lpChannel->HrWriteString("HTTP/1.1 100 Continue\r\n\r\n");
		if (hr != hrSuccess)
			goto exit;
	}
	if (chunked)
		hr = HrReadChunkedBody();
	else
		hr = HrReadFixedBody(ulContLength);
	if (hr == hrSuccess && m_tmpfd < 0)
		fd_log_debug("Request body:\n%s", m_strReqBody.c_str());
 exit:
	if (m_tmpfd >= 0) {
		auto ret = HrCloseSpool();
		if (hr == hrSuccess)
			hr = ret;
	}
	if (hr != hrSuccess)
		m_bBodyFailed = true;
	return hr;
}

/**
 * Hands the parsed request over in a form that does not depend on the
 * connection. The temp file stays owned by this object and is removed
 * with it, unless a handler renamed it away.
 */
HRESULT Http::ToRequest(DavRequest *req)
{
	req->strMethod = m_strMethod;
	req->strPath = m_strPath;
	req->strUrl = m_strURL;
	req->strHttpVer = m_strHttpVer;
	req->mapHeaders = mapHeaders;
	req->strBody = std::move(m_strReqBody);
	req->strTempFile = m_strTempFile;
	m_strReqBody.clear();
	return hrSuccess;
}

/**
 * Sets keep-alive time for the http response
 *
 * @param[in]	ulKeepAlive		Numerical value set as keep-alive time of http connection
 * @return		HRESULT			Always set as hrSuccess
 */
HRESULT Http::HrSetKeepAlive(int ulKeepAlive)
{
	m_ulKeepAlive = ulKeepAlive;
	return hrSuccess;
}

bool Http::KeepAlive() const
{
	std::string strConnection;

	if (m_ulKeepAlive == 0 || m_bBodyFailed || m_strHttpVer != "HTTP/1.1")
		return false;
	return HrGetHeaderValue("Connection", &strConnection) != hrSuccess ||
	       strcasecmp(strConnection.c_str(), "close") != 0;
}

HRESULT Http::HrSendFile(const std::string &path, uint64_t size)
{
	std::string buf;
	int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
	if (fd < 0)
		return fd_errno_to_hr(errno);

	HRESULT hr = hrSuccess;
	while (size > 0) {
		buf.resize(size > HTTP_CHUNK_SIZE ? HTTP_CHUNK_SIZE : size);
		auto rd = read_retry(fd, &buf[0], buf.size());
		if (rd <= 0) {
			/* file shrunk since it was stat'ed; Content-Length is now a lie */
			hr = rd < 0 ? fd_errno_to_hr(errno) : FDERR_CALL_FAILED;
			break;
		}
		buf.resize(rd);
		hr = m_lpChannel->HrWriteString(buf);
		if (hr != hrSuccess)
			break;
		size -= rd;
	}
	close(fd);
	return hr;
}

/**
 * Write the response to the channel, and log it in combined log format.
 *
 * @return	HRESULT
 * @retval	FDERR_END_OF_SESSION	The connection must be closed now
 */
HRESULT Http::HrWriteResponse(const DavResponse &resp)
{
	unsigned int code = resp.ulCode != 0 ? resp.ulCode : 500;
	uint64_t length = resp.strFile.empty() ? resp.strBody.size() : resp.ullFileSize;
	bool keepalive = KeepAlive();
	const char *server = m_lpConfig != nullptr ? m_lpConfig->GetSetting("server_name") : nullptr;
	std::string strOutput, strAgent;

	strOutput = "HTTP/1.1 " + stringify(code) + " " +
	            (resp.strReason.empty() ? "Unknown" : resp.strReason) + "\r\n";
	for (const auto &h : resp.lstHeaders)
		strOutput += h.first + ": " + h.second + "\r\n";
	strOutput += "Server: " + std::string(server != nullptr ? server : "filedav") + "\r\n";
	strOutput += "Date: " + fd_rfc1123_time(time(nullptr)) + "\r\n";
	if (code != 204)
		strOutput += "Content-Length: " + std::to_string(length) + "\r\n";
	if (keepalive) {
		strOutput += "Connection: Keep-Alive\r\n";
		strOutput += "Keep-Alive: timeout=" + stringify(m_ulKeepAlive) + "\r\n";
	} else {
		strOutput += "Connection: close\r\n";
	}
	fd_log_debug("> " + strOutput);
	strOutput += "\r\n";

	auto hr = m_lpChannel->HrWriteString(strOutput);
	if (hr == hrSuccess && m_strMethod != "HEAD" && code != 204) {
		if (!resp.strFile.empty())
			hr = HrSendFile(resp.strFile, resp.ullFileSize);
		else if (!resp.strBody.empty())
			hr = m_lpChannel->HrWriteString(resp.strBody);
		if (!resp.strBody.empty())
			fd_log_debug("Response body:\n%s", resp.strBody.c_str());
	}

	if (HrGetHeaderValue("User-Agent", &strAgent) != hrSuccess)
		strAgent = "-";
	fd_log_notice("%s - - [%s] \"%s\" %u %llu \"-\" \"%s\"", m_lpChannel->peer_addr(),
		fd_clf_time(time(nullptr)).c_str(), m_strAction.c_str(), code,
		static_cast<unsigned long long>(length), strAgent.c_str());
	if (hr != hrSuccess)
		return hr;
	return keepalive ? hrSuccess : FDERR_END_OF_SESSION;
}

/**
 * Sends an empty response with the status matching hr, for requests that
 * never reached a handler.
 */
HRESULT Http::HrWriteError(HRESULT hr)
{
	DavResponse resp;
	resp.HrToHTTPCode(hr);
	return HrWriteResponse(resp);
}

} /* namespace */
