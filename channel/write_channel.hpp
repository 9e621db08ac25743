#ifndef _WRITE_CHANNEL_HPP_
#define _WRITE_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <boost/functional/hash.hpp>
#include <tsl/robin_map.h>

#include "util/clock.hpp"
#include "util/task_pool.hpp"

/* (store name, key) */
using channel_key = std::pair<std::string, std::string>;

/*
 * write_channel - Per (store, key) FIFO of remote store operations
 *
 * Operations of one key never overlap and start in submission order;
 * operations of different keys run in parallel on the channel's workers.
 * An operation taken from a queue that has already written waits until
 * 'write_cooldown' has passed since that write. The wait is held by the
 * channel's timer, never by a worker, so a key in cooldown does not delay
 * other keys.
 */
class write_channel {
public:
	using operation = std::function<void(void)>;

private:
	struct write_queue_entry {
		std::deque<operation> ops;
		system_clock::time_point last_write;
		bool written = false;
		bool running = false;
		/* parked on the timer until its cooldown ends */
		bool deferred = false;
	};

	using queue_map = tsl::robin_map<channel_key, std::shared_ptr<write_queue_entry>, boost::hash<channel_key>>;
	using timer_map = std::multimap<system_clock::time_point, std::pair<channel_key, std::shared_ptr<write_queue_entry>>>;

	std::shared_ptr<clock_source> clk;
	system_clock::duration cooldown;

	std::mutex m;
	std::condition_variable idle_cv;
	std::condition_variable timer_cv;
	queue_map map;
	timer_map timers;
	bool stopping;
	bool timer_stopping;

	task_pool workers;
	std::unique_ptr<std::thread> timer_thr;

	void run(std::shared_ptr<write_queue_entry> e, const channel_key &k);
	void timer_loop(void);

public:
	write_channel(std::shared_ptr<clock_source> clock, std::chrono::seconds write_cooldown, size_t num_workers);
	~write_channel(void);

	/*
	 * enqueue() - Append an operation to the queue of (store, key)
	 *
	 * Returns immediately. The operation must not call drain() or stop().
	 * Throws service_stopping once stop() has been called.
	 */
	void enqueue(const std::string &store, const std::string &key, operation op);

	/* Remove queues idle for at least 'write_cooldown'; called once per heartbeat */
	void tick(void);

	/* Block until (store, key) has nothing pending or running */
	void drain(const std::string &store, const std::string &key);

	/* Reject new operations and wait for every queue to drain */
	void stop(void);

	size_t queue_count(void);
	bool has_queue(const std::string &store, const std::string &key);
};

#endif /* _WRITE_CHANNEL_HPP_ */
