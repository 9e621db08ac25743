#include "write_channel.hpp"

#include <optional>
#include <stdexcept>

#include "lib/logger/logger.hpp"
#include "util/errors.hpp"

write_channel::write_channel(std::shared_ptr<clock_source> clock, std::chrono::seconds write_cooldown, size_t num_workers)
	: clk(clock), cooldown(write_cooldown), stopping(false), timer_stopping(false), workers("write_channel", num_workers)
{
	timer_thr = std::make_unique<std::thread>(&write_channel::timer_loop, this);
}

write_channel::~write_channel(void)
{
	stop();
}

void write_channel::run(std::shared_ptr<write_queue_entry> e, const channel_key &k)
{
	while (true) {
		operation op;

		{
			std::scoped_lock lock(m);

			if (e->ops.empty()) {
				e->running = false;
				idle_cv.notify_all();
				return;
			}

			if (e->written) {
				auto not_before = e->last_write + cooldown;
				if (clk->now() < not_before) {
					global_logger.log(write_channel_ops, "Deferred " + k.first + "/" + k.second + " until its write cooldown ends");
					e->running = false;
					e->deferred = true;
					timers.insert({not_before, {k, e}});
					timer_cv.notify_one();
					return;
				}
			}

			op = std::move(e->ops.front());
			e->ops.pop_front();
		}

		try {
			op();
		} catch (const std::exception &ex) {
			global_logger.warn(write_channel_ops, "Operation on " + k.first + "/" + k.second + " failed: " + ex.what());
		}

		std::scoped_lock lock(m);
		e->last_write = clk->now();
		e->written = true;
	}
}

void write_channel::timer_loop(void)
{
	std::unique_lock lock(m);

	while (!timer_stopping) {
		if (timers.empty()) {
			timer_cv.wait(lock);
			continue;
		}

		auto it = timers.begin();
		if (clk->now() < it->first) {
			clk->wait_until(timer_cv, lock, it->first);
			continue;
		}

		channel_key k = it->second.first;
		auto e = it->second.second;
		timers.erase(it);

		e->deferred = false;
		e->running = true;
		workers.spawn([this, e, k] { run(e, k); });
	}
}

void write_channel::enqueue(const std::string &store, const std::string &key, operation op)
{
	global_logger.log(write_channel_ops, "Called enqueue(" + store + ", " + key + ")");

	channel_key k(store, key);
	std::shared_ptr<write_queue_entry> e;
	bool start = false;

	{
		std::scoped_lock lock(m);

		if (stopping)
			throw service_stopping("write_channel::enqueue() failed (channel is stopped)");

		auto it = map.find(k);
		if (it == map.end()) {
			e = std::make_shared<write_queue_entry>();
			map.insert({k, e});
			global_logger.log(write_channel_ops, "Created the queue of " + store + "/" + key);
		} else {
			e = it->second;
		}

		e->ops.push_back(std::move(op));
		if (!e->running && !e->deferred) {
			e->running = true;
			start = true;
		}
	}

	if (start)
		workers.spawn([this, e, k] { run(e, k); });
}

void write_channel::tick(void)
{
	auto now = clk->now();

	std::scoped_lock lock(m);

	for (auto it = map.begin(); it != map.end();) {
		const auto &e = it->second;
		if (!e->running && !e->deferred && e->ops.empty() && now - e->last_write >= cooldown) {
			global_logger.log(write_channel_ops, "Removed the idle queue of " + it->first.first + "/" + it->first.second);
			it = map.erase(it);
		} else {
			++it;
		}
	}
}

void write_channel::drain(const std::string &store, const std::string &key)
{
	channel_key k(store, key);

	std::unique_lock lock(m);
	idle_cv.wait(lock, [this, &k] {
		auto it = map.find(k);
		return it == map.end() || (!it->second->running && it->second->ops.empty());
	});
}

void write_channel::stop(void)
{
	{
		std::unique_lock lock(m);
		stopping = true;
		idle_cv.wait(lock, [this] {
			for (const auto &p : map) {
				if (p.second->running || !p.second->ops.empty())
					return false;
			}
			return true;
		});
		timer_stopping = true;
	}
	timer_cv.notify_all();

	if (timer_thr) {
		timer_thr->join();
		timer_thr.reset();
	}
	workers.stop();
}

size_t write_channel::queue_count(void)
{
	std::scoped_lock lock(m);
	return map.size();
}

bool write_channel::has_queue(const std::string &store, const std::string &key)
{
	std::scoped_lock lock(m);
	return map.find(channel_key(store, key)) != map.end();
}
