#include "memory_store.hpp"

#include <functional>
#include <thread>

#include "lib/logger/logger.hpp"

namespace {

/* Keeps the in-flight counter balanced on every exit path */
class call_scope {
private:
	std::function<void(void)> on_exit;

public:
	explicit call_scope(std::function<void(void)> fn) : on_exit(std::move(fn)) {}
	~call_scope(void) { on_exit(); }
};

}

memory_store::memory_store(const std::string &store_name, std::shared_ptr<clock_source> clock)
	: name(store_name), clk(clock ? clock : std::make_shared<real_clock>()), max_in_flight(0),
	  latency(0), rate_limit(0), max_value_size(MEMORY_STORE_MAX_VALUE_SIZE)
{
}

void memory_store::begin_call(const std::string &key)
{
	std::optional<failure> f;
	std::chrono::milliseconds delay;

	{
		std::scoped_lock lock(m);

		int now_in_flight = ++in_flight[key];
		if (now_in_flight > max_in_flight)
			max_in_flight = now_in_flight;
		calls[key]++;
		delay = latency;

		if (!injected.empty()) {
			f = injected.front();
			injected.pop_front();
		} else if (rate_limit.count() > 0) {
			auto now = clk->now();
			auto it = last_call.find(key);
			if (it != last_call.end() && now - it->second < rate_limit)
				f = failure::rate_limited;
			else
				last_call[key] = now;
		}
	}

	if (delay.count() > 0)
		std::this_thread::sleep_for(delay);

	if (!f)
		return;

	end_call(key);

	switch (*f) {
	case failure::rate_limited:
		throw transient_store_error("memory_store: rate limited (key: \"" + key + "\")");
	case failure::timeout:
		throw transient_store_error("memory_store: timed out (key: \"" + key + "\")");
	case failure::unavailable:
	default:
		throw store_unavailable("memory_store: unavailable (key: \"" + key + "\")");
	}
}

void memory_store::end_call(const std::string &key)
{
	std::scoped_lock lock(m);
	in_flight[key]--;
}

const std::string &memory_store::get_name(void) const
{
	return name;
}

std::optional<std::string> memory_store::get(const std::string &key)
{
	global_logger.log(store_ops, "Called get(" + key + ")");
	begin_call(key);
	call_scope scope([this, &key] { end_call(key); });

	std::scoped_lock lock(m);
	auto it = map.find(key);
	if (it == map.end())
		return std::nullopt;

	return it->second.value;
}

std::optional<std::string> memory_store::update(const std::string &key, const transform_fn &transform)
{
	global_logger.log(store_ops, "Called update(" + key + ")");
	begin_call(key);
	call_scope scope([this, &key] { end_call(key); });

	while (true) {
		std::optional<std::string> current;
		std::optional<uint64_t> version;
		size_t limit;

		{
			std::scoped_lock lock(m);
			limit = max_value_size;
			auto it = map.find(key);
			if (it != map.end()) {
				current = it->second.value;
				version = it->second.version;
			}
		}

		auto next = transform(current);
		if (!next)
			return current;

		if (next->size() > limit)
			throw payload_too_large("memory_store: value of " + std::to_string(next->size()) + " bytes exceeds the limit (key: \"" + key + "\")");

		std::scoped_lock lock(m);
		auto it = map.find(key);
		if (!version) {
			if (it != map.end())
				continue;	/* created concurrently */
			map.insert({key, entry{*next, 1}});
			return next;
		}

		if (it == map.end() || it->second.version != *version)
			continue;	/* lost the race, run the transform again */

		it.value().value = *next;
		it.value().version++;
		return next;
	}
}

void memory_store::remove(const std::string &key)
{
	global_logger.log(store_ops, "Called remove(" + key + ")");
	begin_call(key);
	call_scope scope([this, &key] { end_call(key); });

	std::scoped_lock lock(m);
	map.erase(key);
}

void memory_store::fail_next(size_t count, failure kind)
{
	std::scoped_lock lock(m);
	for (size_t i = 0; i < count; i++)
		injected.push_back(kind);
}

void memory_store::set_latency(std::chrono::milliseconds l)
{
	std::scoped_lock lock(m);
	latency = l;
}

void memory_store::set_rate_limit(std::chrono::seconds limit)
{
	std::scoped_lock lock(m);
	rate_limit = limit;
}

void memory_store::set_max_value_size(size_t size)
{
	std::scoped_lock lock(m);
	max_value_size = size;
}

void memory_store::put_raw(const std::string &key, const std::string &value)
{
	std::scoped_lock lock(m);
	auto it = map.find(key);
	if (it == map.end()) {
		map.insert({key, entry{value, 1}});
	} else {
		it.value().value = value;
		it.value().version++;
	}
}

std::optional<std::string> memory_store::peek(const std::string &key) const
{
	std::scoped_lock lock(m);
	auto it = map.find(key);
	if (it == map.end())
		return std::nullopt;

	return it->second.value;
}

size_t memory_store::get_call_count(const std::string &key) const
{
	std::scoped_lock lock(m);
	auto it = calls.find(key);
	return it == calls.end() ? 0 : it->second;
}

int memory_store::get_max_in_flight(void) const
{
	std::scoped_lock lock(m);
	return max_in_flight;
}
