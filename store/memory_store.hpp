#ifndef _MEMORY_STORE_HPP_
#define _MEMORY_STORE_HPP_

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <tsl/robin_map.h>

#include "remote_store.hpp"
#include "util/clock.hpp"

#define MEMORY_STORE_MAX_VALUE_SIZE (4 * 1024 * 1024)

/*
 * memory_store - In-process remote_store for tests and local runs
 *
 * update() follows the same optimistic protocol as a real service: the
 * transform runs outside the store lock and the result is committed only
 * if the key's version has not moved meanwhile.
 *
 * Faults can be injected with fail_next(), per-key rate limiting enabled
 * with set_rate_limit(), and per-key concurrency observed with
 * get_max_in_flight().
 */
class memory_store : public remote_store {
public:
	enum class failure {
		rate_limited,
		timeout,
		unavailable,
	};

private:
	struct entry {
		std::string value;
		uint64_t version;
	};

	std::string name;
	std::shared_ptr<clock_source> clk;

	mutable std::mutex m;
	tsl::robin_map<std::string, entry> map;
	std::deque<failure> injected;

	tsl::robin_map<std::string, int> in_flight;
	tsl::robin_map<std::string, size_t> calls;
	tsl::robin_map<std::string, system_clock::time_point> last_call;
	int max_in_flight;

	std::chrono::milliseconds latency;
	std::chrono::seconds rate_limit;
	size_t max_value_size;

	void begin_call(const std::string &key);
	void end_call(const std::string &key);

public:
	explicit memory_store(const std::string &store_name, std::shared_ptr<clock_source> clock = nullptr);
	~memory_store(void) = default;

	const std::string &get_name(void) const override;
	std::optional<std::string> get(const std::string &key) override;
	std::optional<std::string> update(const std::string &key, const transform_fn &transform) override;
	void remove(const std::string &key) override;

	/* The next 'count' calls fail with 'kind' */
	void fail_next(size_t count, failure kind);
	/* Real time spent inside every call */
	void set_latency(std::chrono::milliseconds l);
	void set_rate_limit(std::chrono::seconds limit);
	void set_max_value_size(size_t size);

	void put_raw(const std::string &key, const std::string &value);
	std::optional<std::string> peek(const std::string &key) const;
	size_t get_call_count(const std::string &key) const;
	int get_max_in_flight(void) const;
};

#endif /* _MEMORY_STORE_HPP_ */
