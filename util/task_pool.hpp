#ifndef _TASK_POOL_HPP_
#define _TASK_POOL_HPP_

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mqueue.hpp"

/*
 * task_pool - Fixed set of worker threads fed by one mqueue
 *
 * Used for write channel queues, auto-save calls and listener dispatch.
 * A task that throws a std::exception is logged; the worker keeps going.
 */
class task_pool {
private:
	std::string name;
	mqueue<std::function<void(void)>> q;
	std::vector<std::unique_ptr<std::thread>> workers;

	std::mutex m;
	std::condition_variable idle_cv;
	size_t pending;
	bool stopped;

	void worker_loop(void);

public:
	task_pool(const std::string &pool_name, size_t num_workers);
	~task_pool(void);

	task_pool(const task_pool &) = delete;
	task_pool &operator=(const task_pool &) = delete;

	void spawn(std::function<void(void)> task);

	/* Block until every spawned task has finished */
	void wait_idle(void);

	/* Finish queued tasks and join the workers; spawn() is rejected afterwards */
	void stop(void);
};

#endif /* _TASK_POOL_HPP_ */
