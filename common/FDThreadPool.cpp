/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <mutex>
#include <string>
#include <cstring>
#include <pthread.h>
#include <filedav/platform.h>
#include <filedav/FDLogger.h>
#include <filedav/FDThreadPool.h>

namespace FD {

FDThreadPool::FDThreadPool(const std::string &name, unsigned int threads) :
	m_name(name)
{
	for (unsigned int i = 0; i < threads; ++i) {
		pthread_t tid;
		auto ret = pthread_create(&tid, nullptr, &worker_main, this);
		if (ret != 0) {
			fd_log_err("Could not create %s worker thread: %s", m_name.c_str(), strerror(ret));
			break;
		}
		m_threads.push_back(tid);
	}
}

FDThreadPool::~FDThreadPool()
{
	ulock_normal lk(m_mtx);
	m_stop = true;
	m_cond.notify_all();
	lk.unlock();
	for (auto tid : m_threads)
		pthread_join(tid, nullptr);
	for (const auto &q : m_queue)
		if (q.owned)
			delete q.task;
}

/**
 * Queues a task. With @take_ownership, the pool deletes the task after
 * running it.
 *
 * @return false when there is no worker to run the task
 */
bool FDThreadPool::enqueue(FDTask *task, bool take_ownership)
{
	if (task == nullptr || m_threads.empty())
		return false;
	scoped_lock lk(m_mtx);
	if (m_stop)
		return false;
	m_queue.push_back({task, take_ownership});
	m_cond.notify_one();
	return true;
}

void *FDThreadPool::worker_main(void *arg)
{
	auto pool = static_cast<FDThreadPool *>(arg);
	fdsrv_blocksigs();
	set_thread_name(pthread_self(), pool->m_name);
	pool->work();
	return nullptr;
}

void FDThreadPool::work()
{
	ulock_normal lk(m_mtx);
	while (true) {
		m_cond.wait(lk, [this]() { return m_stop || !m_queue.empty(); });
		if (m_stop)
			return;
		auto q = m_queue.front();
		m_queue.pop_front();
		lk.unlock();
		q.task->execute();
		if (q.owned)
			delete q.task;
		lk.lock();
	}
}

FDWaitableTask::~FDWaitableTask()
{
	ulock_normal lk(m_mtx);
	m_cond.wait(lk, [this]() { return !m_running; });
}

void FDWaitableTask::execute()
{
	ulock_normal lk(m_mtx);
	m_running = true;
	lk.unlock();

	FDTask::execute();

	lk.lock();
	m_running = false;
	m_done = true;
	m_cond.notify_all();
}

bool FDWaitableTask::done() const
{
	scoped_lock lk(m_mtx);
	return m_done;
}

void FDWaitableTask::wait() const
{
	ulock_normal lk(m_mtx);
	m_cond.wait(lk, [this]() { return m_done; });
}

} /* namespace */
