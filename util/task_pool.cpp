#include "task_pool.hpp"

#include <stdexcept>

#include "lib/logger/logger.hpp"

task_pool::task_pool(const std::string &pool_name, size_t num_workers) : name(pool_name), pending(0), stopped(false)
{
	if (num_workers == 0)
		throw std::invalid_argument("task_pool::task_pool() failed (no workers for \"" + name + "\")");

	for (size_t i = 0; i < num_workers; i++)
		workers.push_back(std::make_unique<std::thread>(&task_pool::worker_loop, this));

	global_logger.log(task_pool_ops, "Started " + std::to_string(num_workers) + " workers for \"" + name + "\"");
}

task_pool::~task_pool(void)
{
	stop();
}

void task_pool::worker_loop(void)
{
	while (true) {
		auto task = q.dispatch();
		if (!task)	/* closed and drained */
			break;

		try {
			(*task)();
		} catch (const std::exception &e) {
			global_logger.warn(task_pool_ops, "Task in \"" + name + "\" failed: " + e.what());
		}

		std::scoped_lock lock(m);
		if (--pending == 0)
			idle_cv.notify_all();
	}
}

void task_pool::spawn(std::function<void(void)> task)
{
	if (!task)
		throw std::invalid_argument("task_pool::spawn() failed (empty task)");

	std::scoped_lock lock(m);
	if (stopped)
		throw std::runtime_error("task_pool::spawn() failed (\"" + name + "\" is stopped)");

	q.issue(std::move(task));
	pending++;
}

void task_pool::wait_idle(void)
{
	std::unique_lock lock(m);
	idle_cv.wait(lock, [this] { return pending == 0; });
}

void task_pool::stop(void)
{
	{
		std::scoped_lock lock(m);
		if (stopped)
			return;
		stopped = true;
	}

	q.close();
	for (auto &w : workers)
		w->join();
	workers.clear();

	global_logger.log(task_pool_ops, "Stopped \"" + name + "\"");
}
