#ifndef _NOTIFIER_HPP_
#define _NOTIFIER_HPP_

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <tsl/robin_map.h>

#include "lib/logger/logger.hpp"
#include "task_pool.hpp"

/*
 * notifier - Multi-listener broadcast
 *
 * Listeners live in a registry keyed by subscription id. fire() runs every
 * listener connected at the time of the call, in connection order. With a
 * dispatcher attached each listener runs as its own task on that pool and
 * fire() does not wait for them. A listener that throws is logged and the
 * remaining listeners still run.
 */
template <typename... Args>
class notifier {
public:
	using listener = std::function<void(Args...)>;

private:
	struct registry {
		std::mutex m;
		uint64_t next_id = 1;
		tsl::robin_map<uint64_t, listener> listeners;
	};

	std::shared_ptr<registry> reg;
	std::atomic<task_pool *> dispatcher;

	static void invoke(const listener &fn, Args... args)
	{
		try {
			fn(args...);
		} catch (const std::exception &e) {
			global_logger.warn(signal_ops, std::string("Listener failed: ") + e.what());
		}
	}

public:
	class connection {
	private:
		std::weak_ptr<registry> reg;
		uint64_t id;

	public:
		connection(void) : id(0) {}
		connection(std::weak_ptr<registry> r, uint64_t sub_id) : reg(std::move(r)), id(sub_id) {}

		void disconnect(void)
		{
			if (auto r = reg.lock()) {
				std::scoped_lock lock(r->m);
				r->listeners.erase(id);
			}
			reg.reset();
		}

		bool connected(void) const
		{
			auto r = reg.lock();
			if (!r)
				return false;

			std::scoped_lock lock(r->m);
			return r->listeners.find(id) != r->listeners.end();
		}
	};

	notifier(void) : reg(std::make_shared<registry>()), dispatcher(nullptr) {}

	notifier(const notifier &) = delete;
	notifier &operator=(const notifier &) = delete;

	/* 'pool' must outlive the notifier; nullptr runs listeners inline */
	void set_dispatcher(task_pool *pool)
	{
		dispatcher = pool;
	}

	connection connect(listener fn)
	{
		std::scoped_lock lock(reg->m);

		uint64_t id = reg->next_id++;
		reg->listeners.insert({id, std::move(fn)});

		return connection(reg, id);
	}

	void fire(Args... args)
	{
		std::vector<std::pair<uint64_t, listener>> current;

		{
			std::scoped_lock lock(reg->m);
			for (const auto &p : reg->listeners)
				current.emplace_back(p.first, p.second);
		}

		std::sort(current.begin(), current.end(),
			  [](const auto &a, const auto &b) { return a.first < b.first; });

		task_pool *pool = dispatcher;
		for (auto &p : current) {
			if (pool) {
				listener fn = std::move(p.second);
				pool->spawn([fn, args...]() { invoke(fn, args...); });
			} else {
				invoke(p.second, args...);
			}
		}
	}

	size_t listener_count(void) const
	{
		std::scoped_lock lock(reg->m);
		return reg->listeners.size();
	}
};

#endif /* _NOTIFIER_HPP_ */
