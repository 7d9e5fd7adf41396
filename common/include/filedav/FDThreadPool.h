/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FDTHREADPOOL_INCLUDED
#define FDTHREADPOOL_INCLUDED

#include <condition_variable>
#include <list>
#include <mutex>
#include <string>
#include <vector>
#include <pthread.h>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

namespace FD {

class FDTask;

/**
 * A fixed set of worker threads that run queued tasks in FIFO order.
 * With one thread, tasks run strictly in the order they were queued.
 * The destructor stops the workers; tasks still queued are dropped.
 */
class FD_EXPORT FDThreadPool FD_FINAL {
	public:
	FDThreadPool(const std::string &name, unsigned int threads);
	~FDThreadPool();
	bool enqueue(FDTask *, bool take_ownership = false);
	size_t thread_count() const { return m_threads.size(); }

	private:
	struct queued_task {
		FDTask *task;
		bool owned;
	};

	FD_HIDDEN static void *worker_main(void *);
	FD_HIDDEN void work();

	std::string m_name;
	std::vector<pthread_t> m_threads;
	std::list<queued_task> m_queue;
	std::mutex m_mtx;
	std::condition_variable m_cond;
	bool m_stop = false;

	FDThreadPool(const FDThreadPool &) = delete;
	FDThreadPool &operator=(const FDThreadPool &) = delete;
};

/**
 * Unit of work for an FDThreadPool. The pool calls execute(), which runs
 * run() of the derived class.
 */
class FD_EXPORT FDTask {
	public:
	virtual ~FDTask() = default;
	virtual void execute() { run(); }
	bool queue_on(FDThreadPool *p, bool transfer_ownership = false)
	{
		return p != nullptr && p->enqueue(this, transfer_ownership);
	}

	protected:
	FDTask() = default;
	virtual void run() = 0;

	private:
	FDTask(const FDTask &) = delete;
	FDTask &operator=(const FDTask &) = delete;
};

/**
 * A task whose completion can be waited for.
 */
class FD_EXPORT FDWaitableTask : public FDTask {
	public:
	/* blocks while the task is running */
	virtual ~FDWaitableTask();
	void execute() override;
	bool done() const;
	void wait() const;

	protected:
	FDWaitableTask() = default;

	private:
	mutable std::mutex m_mtx;
	mutable std::condition_variable m_cond;
	bool m_running = false, m_done = false;
};

} /* namespace */

#endif /* FDTHREADPOOL_INCLUDED */
