#ifndef _RECORD_GATEWAY_HPP_
#define _RECORD_GATEWAY_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "channel/write_channel.hpp"
#include "health/health_monitor.hpp"
#include "store/record_codec.hpp"
#include "store/remote_store.hpp"
#include "util/clock.hpp"
#include "util/notifier.hpp"

/*
 * record_gateway - Record-level access to a remote_store
 *
 * Every call is queued on the write channel of its (store, key), so calls
 * for one key reach the store one at a time and spaced by the write
 * cooldown. Transient failures are retried with capped exponential
 * backoff; every failed attempt is reported to the health monitor.
 */
class record_gateway {
public:
	/*
	 * Maps the current record (nullopt if absent) to the record to store,
	 * or to nullopt to leave the stored value untouched. Runs once per
	 * attempt, so it must not depend on having run before.
	 */
	using updater = std::function<std::optional<record>(const std::optional<record> &current)>;

	struct retry_policy {
		int attempts;
		std::chrono::milliseconds base_delay;
		std::chrono::milliseconds max_delay;
	};

private:
	write_channel &channel;
	health_monitor &health;
	std::shared_ptr<clock_source> clk;
	retry_policy policy;

	std::mutex rng_m;
	std::mt19937 rng;

	template <typename T>
	T call(remote_store &store, const std::string &key, const char *what, std::function<T(void)> fn);

	system_clock::duration backoff(int attempt);

public:
	/* (store name, key) of a record that failed to decode */
	notifier<std::string, std::string> corruption;

	record_gateway(write_channel &ch, health_monitor &hm, std::shared_ptr<clock_source> clock, const retry_policy &p);
	~record_gateway(void) = default;

	/* Throws store_unavailable, payload_too_large or data_corruption */
	std::optional<record> fetch(remote_store &store, const std::string &key);
	std::optional<record> persist(remote_store &store, const std::string &key, const updater &fn);
	void remove(remote_store &store, const std::string &key);
};

#endif /* _RECORD_GATEWAY_HPP_ */
