/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef DAVDELEGATE_H
#define DAVDELEGATE_H

#include <memory>
#include <string>
#include <filedav/fddefs.h>
#include <filedav/FDThreadPool.h>

namespace FD {

/**
 * Application hooks around mutations. The should* hooks run on the
 * request thread before a change and can veto it; they may be called
 * concurrently. The did* notifications run after a successful change,
 * one at a time, on the notifier thread.
 *
 * All paths are canonical filesystem paths.
 */
class FD_EXPORT DavDelegate {
	public:
	virtual ~DavDelegate() = default;
	virtual bool shouldUploadFileAtPath(const std::string &path, const std::string &temp_path) { return true; }
	virtual bool shouldMoveItemFromPath(const std::string &from, const std::string &to) { return true; }
	virtual bool shouldCopyItemFromPath(const std::string &from, const std::string &to) { return true; }
	virtual bool shouldDeleteItemAtPath(const std::string &path) { return true; }
	virtual bool shouldCreateDirectoryAtPath(const std::string &path) { return true; }

	virtual void didDownloadFileAtPath(const std::string &path) {}
	virtual void didUploadFileAtPath(const std::string &path) {}
	virtual void didMoveItemFromPath(const std::string &from, const std::string &to) {}
	virtual void didCopyItemFromPath(const std::string &from, const std::string &to) {}
	virtual void didDeleteItemAtPath(const std::string &path) {}
	virtual void didCreateDirectoryAtPath(const std::string &path) {}
};

/**
 * Logs every notification at notice level. Installed by the daemon.
 */
class FD_EXPORT LoggingDelegate FD_FINAL : public DavDelegate {
	public:
	void didDownloadFileAtPath(const std::string &) override;
	void didUploadFileAtPath(const std::string &) override;
	void didMoveItemFromPath(const std::string &, const std::string &) override;
	void didCopyItemFromPath(const std::string &, const std::string &) override;
	void didDeleteItemAtPath(const std::string &) override;
	void didCreateDirectoryAtPath(const std::string &) override;
};

enum DavEvent {
	DAV_EVENT_DOWNLOAD,
	DAV_EVENT_UPLOAD,
	DAV_EVENT_MOVE,
	DAV_EVENT_COPY,
	DAV_EVENT_DELETE,
	DAV_EVENT_MKCOL,
};

/**
 * Delivers notifications to the delegate on a single worker thread, in
 * the order they were posted.
 */
class FD_EXPORT DavNotifier FD_FINAL {
	public:
	DavNotifier(std::shared_ptr<DavDelegate>);
	~DavNotifier();
	void post(DavEvent, const std::string &path, const std::string &path2 = {});
	void flush();
	DavDelegate *delegate() const { return m_delegate.get(); }

	private:
	std::shared_ptr<DavDelegate> m_delegate;
	FDThreadPool m_pool;
};

} /* namespace */

#endif
