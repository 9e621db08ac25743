#ifndef _AUTO_SAVE_HPP_
#define _AUTO_SAVE_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "lease.hpp"
#include "util/clock.hpp"
#include "util/task_pool.hpp"

/*
 * auto_save_scheduler - Keeps active leases persisted and alive
 *
 * Every tick (one second) saves ceil(n / auto_save_interval) of the n
 * scheduled leases, walking them round-robin, so each lease is saved about
 * once per auto_save_interval without bursting the store. Leases loaded
 * less than auto_save_interval ago are passed over while an older one is
 * available.
 */
class auto_save_scheduler {
public:
	using save_fn = std::function<void(std::shared_ptr<lease>)>;

private:
	std::shared_ptr<clock_source> clk;
	system_clock::duration interval;
	system_clock::duration overdue_after;
	int64_t interval_seconds;
	task_pool &pool;
	save_fn save;

	std::mutex m;
	std::vector<std::shared_ptr<lease>> list;
	size_t cursor;

	void erase_at(size_t index);
	void spawn_save(const std::shared_ptr<lease> &l);

public:
	auto_save_scheduler(std::shared_ptr<clock_source> clock, std::chrono::seconds auto_save_interval,
			    std::chrono::seconds dead_lock_assumed_after, task_pool &save_pool, save_fn fn);
	~auto_save_scheduler(void) = default;

	void add(std::shared_ptr<lease> l);
	void remove(const std::shared_ptr<lease> &l);
	size_t size(void);

	void tick(void);
};

#endif /* _AUTO_SAVE_HPP_ */
