/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVSECURITY_H
#define DAVSECURITY_H

#include <set>
#include <string>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

namespace FD {

/**
 * Decides whether a request path may be touched at all. Every handler asks
 * here before it looks at the filesystem.
 *
 * A path passes when, after canonicalization, it is the upload directory
 * or lies below it; when none of its components is hidden (unless hidden
 * items are allowed); and when its extension is on the allow-list (unless
 * the list is empty or the path is a collection).
 */
class FD_EXPORT DavSecurity FD_FINAL {
	public:
	DavSecurity(const std::string &root, const std::string &extensions, bool allow_hidden);
	HRESULT HrInit();
	HRESULT HrAuthorize(const std::string &davpath, std::string *fspath, bool collection = false) const;
	bool IsRoot(const std::string &fspath) const { return fspath == m_strRoot; }
	bool ExtensionAllowed(const std::string &name) const;
	bool NameAllowed(const std::string &name, bool collection) const;
	const std::string &root() const { return m_strRoot; }

	private:
	FD_HIDDEN HRESULT HrCanonicalize(const std::string &davpath, std::string *fspath) const;

	std::string m_strRoot;
	std::set<std::string> m_setExtensions;
	bool m_bAllowHidden;
};

} /* namespace */

#endif
