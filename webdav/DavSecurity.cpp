/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <memory>
#include <string>
#include <vector>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sys/stat.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/memory.hpp>
#include <filedav/stringutil.h>
#include "DavSecurity.h"

namespace FD {

/**
 * @param[in]	root		the upload directory
 * @param[in]	extensions	allowed file extensions, separated by spaces or
 *				commas, with or without leading dot. Empty
 *				allows everything.
 * @param[in]	allow_hidden	whether names starting with a dot are served
 */
DavSecurity::DavSecurity(const std::string &root, const std::string &extensions,
    bool allow_hidden) :
	m_strRoot(root), m_bAllowHidden(allow_hidden)
{
	for (auto ext : tokenize(extensions, " \t,")) {
		while (!ext.empty() && ext[0] == '.')
			ext.erase(0, 1);
		if (!ext.empty())
			m_setExtensions.emplace(strToLower(std::move(ext)));
	}
}

/**
 * Resolves the upload directory itself. Must be called once before
 * HrAuthorize.
 *
 * @retval FDERR_NOT_FOUND	root does not exist or is not a directory
 */
HRESULT DavSecurity::HrInit()
{
	if (m_strRoot.empty()) {
		fd_log_err("No upload directory configured");
		return FDERR_INVALID_PARAMETER;
	}
	std::unique_ptr<char, cstdlib_deleter> canon(realpath(m_strRoot.c_str(), nullptr));
	if (canon == nullptr) {
		int saved_errno = errno;
		fd_log_err("Upload directory \"%s\" unusable: %s", m_strRoot.c_str(), strerror(saved_errno));
		return fd_errno_to_hr(saved_errno);
	}
	struct stat sb;
	if (stat(canon.get(), &sb) != 0 || !S_ISDIR(sb.st_mode)) {
		fd_log_err("Upload directory \"%s\" is not a directory", canon.get());
		return FDERR_NOT_FOUND;
	}
	m_strRoot = canon.get();
	return hrSuccess;
}

/**
 * Maps a DAV path onto the filesystem. "." and ".." are folded away first,
 * so that a ".." can never climb out of a component that realpath(3) did
 * not see. The longest prefix that exists is then resolved with realpath,
 * so symlinks are followed. The remaining components are appended as they
 * are, which lets paths that are about to be created (PUT, MKCOL,
 * Destination) be checked too.
 *
 * @retval FDERR_NO_ACCESS	".." goes above the root
 */
HRESULT DavSecurity::HrCanonicalize(const std::string &davpath, std::string *fspath) const
{
	std::vector<std::string> comps;

	for (auto &c : tokenize(davpath, '/', true)) {
		if (c == ".")
			continue;
		if (c != "..") {
			comps.emplace_back(std::move(c));
			continue;
		}
		if (comps.empty())
			return FDERR_NO_ACCESS;
		comps.pop_back();
	}

	for (size_t i = comps.size() + 1; i-- > 0; ) {
		std::string prefix = m_strRoot;
		for (size_t j = 0; j < i; ++j)
			prefix += "/" + comps[j];
		std::unique_ptr<char, cstdlib_deleter> canon(realpath(prefix.c_str(), nullptr));
		if (canon == nullptr) {
			if (errno == ENOENT || errno == ENOTDIR)
				continue;
			return fd_errno_to_hr(errno);
		}
		std::string resolved = canon.get();
		for (size_t j = i; j < comps.size(); ++j) {
			if (resolved.back() != '/')
				resolved += '/';
			resolved += comps[j];
		}
		*fspath = std::move(resolved);
		return hrSuccess;
	}
	/* not even the root resolved */
	return FDERR_NOT_FOUND;
}

bool DavSecurity::ExtensionAllowed(const std::string &name) const
{
	if (m_setExtensions.empty())
		return true;
	auto pos = name.rfind('.');
	if (pos == std::string::npos || pos == 0)
		return false;
	return m_setExtensions.find(strToLower(name.substr(pos + 1))) != m_setExtensions.cend();
}

/**
 * Checks a single name, as seen in a directory listing.
 */
bool DavSecurity::NameAllowed(const std::string &name, bool collection) const
{
	if (!m_bAllowHidden && !name.empty() && name[0] == '.')
		return false;
	return collection || ExtensionAllowed(name);
}

/**
 * Authorizes a DAV path for any kind of access.
 *
 * @param[in]	davpath		decoded request path, relative to the root
 * @param[out]	fspath		canonical filesystem path
 * @param[in]	collection	the caller knows the target is a collection
 *				(MKCOL), so the extension check is skipped
 *
 * @return	HRESULT
 * @retval	FDERR_NO_ACCESS	path is hidden, escapes the root, or has an
 *				extension that is not allowed
 */
HRESULT DavSecurity::HrAuthorize(const std::string &davpath, std::string *fspath,
    bool collection) const
{
	auto comps = tokenize(davpath, '/', true);

	if (!m_bAllowHidden)
		for (const auto &c : comps)
			if (c[0] == '.') {
				fd_log_debug("Rejecting hidden path \"%s\"", davpath.c_str());
				return FDERR_NO_ACCESS;
			}

	std::string resolved;
	auto hr = HrCanonicalize(davpath, &resolved);
	if (hr == FDERR_NO_ACCESS)
		fd_log_warn("Rejecting path \"%s\" above the upload directory", davpath.c_str());
	if (hr != hrSuccess)
		return hr;
	if (resolved != m_strRoot && m_strRoot != "/" &&
	    !fd_starts_with(resolved, m_strRoot + "/")) {
		fd_log_warn("Rejecting path \"%s\" outside of the upload directory", davpath.c_str());
		return FDERR_NO_ACCESS;
	}

	if (!collection && !comps.empty() && davpath.back() != '/') {
		struct stat sb;
		collection = stat(resolved.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
		if (!collection && !ExtensionAllowed(comps.back())) {
			fd_log_debug("Rejecting \"%s\": extension not allowed", davpath.c_str());
			return FDERR_NO_ACCESS;
		}
	}
	*fspath = std::move(resolved);
	return hrSuccess;
}

} /* namespace */
