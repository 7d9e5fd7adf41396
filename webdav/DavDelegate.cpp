/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <filedav/FDLogger.h>
#include "DavDelegate.h"

namespace FD {

void LoggingDelegate::didDownloadFileAtPath(const std::string &path)
{
	fd_log_notice("Downloaded \"%s\"", path.c_str());
}

void LoggingDelegate::didUploadFileAtPath(const std::string &path)
{
	fd_log_notice("Uploaded \"%s\"", path.c_str());
}

void LoggingDelegate::didMoveItemFromPath(const std::string &from, const std::string &to)
{
	fd_log_notice("Moved \"%s\" to \"%s\"", from.c_str(), to.c_str());
}

void LoggingDelegate::didCopyItemFromPath(const std::string &from, const std::string &to)
{
	fd_log_notice("Copied \"%s\" to \"%s\"", from.c_str(), to.c_str());
}

void LoggingDelegate::didDeleteItemAtPath(const std::string &path)
{
	fd_log_notice("Deleted \"%s\"", path.c_str());
}

void LoggingDelegate::didCreateDirectoryAtPath(const std::string &path)
{
	fd_log_notice("Created directory \"%s\"", path.c_str());
}

class DavNotifyTask FD_FINAL : public FDTask {
	public:
	DavNotifyTask(std::shared_ptr<DavDelegate> d, DavEvent ev, std::string p1, std::string p2) :
		m_delegate(std::move(d)), m_event(ev), m_path(std::move(p1)), m_path2(std::move(p2))
	{}

	protected:
	void run() override
	{
		switch (m_event) {
		case DAV_EVENT_DOWNLOAD:
			m_delegate->didDownloadFileAtPath(m_path);
			break;
		case DAV_EVENT_UPLOAD:
			m_delegate->didUploadFileAtPath(m_path);
			break;
		case DAV_EVENT_MOVE:
			m_delegate->didMoveItemFromPath(m_path, m_path2);
			break;
		case DAV_EVENT_COPY:
			m_delegate->didCopyItemFromPath(m_path, m_path2);
			break;
		case DAV_EVENT_DELETE:
			m_delegate->didDeleteItemAtPath(m_path);
			break;
		case DAV_EVENT_MKCOL:
			m_delegate->didCreateDirectoryAtPath(m_path);
			break;
		}
	}

	private:
	std::shared_ptr<DavDelegate> m_delegate;
	DavEvent m_event;
	std::string m_path, m_path2;
};

/* Queued behind all notifications; done once those have run. */
class DavBarrierTask FD_FINAL : public FDWaitableTask {
	protected:
	void run() override {}
};

DavNotifier::DavNotifier(std::shared_ptr<DavDelegate> d) :
	m_delegate(d != nullptr ? std::move(d) : std::make_shared<DavDelegate>()),
	m_pool("notify", 1)
{}

DavNotifier::~DavNotifier()
{
	flush();
}

void DavNotifier::post(DavEvent ev, const std::string &path, const std::string &path2)
{
	auto task = new(std::nothrow) DavNotifyTask(m_delegate, ev, path, path2);
	if (task == nullptr) {
		fd_log_err("Out of memory queueing notification for \"%s\"", path.c_str());
		return;
	}
	if (!task->queue_on(&m_pool, true)) {
		fd_log_err("Could not queue notification for \"%s\"", path.c_str());
		delete task;
	}
}

/**
 * Waits until every notification posted so far has been delivered.
 */
void DavNotifier::flush()
{
	DavBarrierTask barrier;
	if (!barrier.queue_on(&m_pool, false)) {
		fd_log_err("Could not queue notification barrier");
		return;
	}
	barrier.wait();
}

} /* namespace */
