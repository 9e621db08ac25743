#include "record_gateway.hpp"

#include <algorithm>
#include <future>
#include <type_traits>

#include "lib/logger/logger.hpp"
#include "util/errors.hpp"

record_gateway::record_gateway(write_channel &ch, health_monitor &hm, std::shared_ptr<clock_source> clock, const retry_policy &p)
	: channel(ch), health(hm), clk(clock), policy(p), rng(std::random_device{}())
{
}

system_clock::duration record_gateway::backoff(int attempt)
{
	auto delay = policy.base_delay;
	for (int i = 1; i < attempt && delay < policy.max_delay; i++)
		delay *= 2;
	delay = std::min(delay, policy.max_delay);

	/* full delay halved, plus a random part of the other half */
	std::uniform_int_distribution<long long> jitter(0, delay.count() / 2);
	std::scoped_lock lock(rng_m);
	return std::chrono::milliseconds(delay.count() - delay.count() / 2 + jitter(rng));
}

template <typename T>
T record_gateway::call(remote_store &store, const std::string &key, const char *what, std::function<T(void)> fn)
{
	const std::string &name = store.get_name();

	for (int attempt = 1; ; attempt++) {
		auto done = std::make_shared<std::promise<T>>();
		auto result = done->get_future();

		channel.enqueue(name, key, [done, &fn] {
			try {
				if constexpr (std::is_void_v<T>) {
					fn();
					done->set_value();
				} else {
					done->set_value(fn());
				}
			} catch (...) {
				done->set_exception(std::current_exception());
			}
		});

		try {
			return result.get();
		} catch (const transient_store_error &e) {
			health.report_issue();
			if (attempt >= policy.attempts) {
				global_logger.warn(gateway_ops, std::string(what) + "(" + name + "/" + key + ") gave up after " + std::to_string(attempt) + " attempts");
				throw store_unavailable(std::string("record_gateway::") + what + "() failed (retries exhausted: " + e.what() + ")");
			}
			global_logger.log(gateway_ops, std::string(what) + "(" + name + "/" + key + ") attempt " + std::to_string(attempt) + " failed: " + e.what());
		} catch (const data_corruption &e) {
			health.report_issue();
			global_logger.warn(gateway_ops, "Record " + name + "/" + key + " is corrupted: " + e.what());
			corruption.fire(name, key);
			throw;
		} catch (const store_error &e) {
			health.report_issue();
			global_logger.warn(gateway_ops, std::string(what) + "(" + name + "/" + key + ") failed: " + e.what());
			throw;
		}

		clk->sleep_for(backoff(attempt));
	}
}

std::optional<record> record_gateway::fetch(remote_store &store, const std::string &key)
{
	global_logger.log(gateway_ops, "Called fetch(" + store.get_name() + ", " + key + ")");

	return call<std::optional<record>>(store, key, "fetch", [&store, &key]() -> std::optional<record> {
		auto value = store.get(key);
		if (!value)
			return std::nullopt;
		return decode_record(*value);
	});
}

std::optional<record> record_gateway::persist(remote_store &store, const std::string &key, const updater &fn)
{
	global_logger.log(gateway_ops, "Called persist(" + store.get_name() + ", " + key + ")");

	return call<std::optional<record>>(store, key, "persist", [&store, &key, &fn]() -> std::optional<record> {
		auto value = store.update(key, [&fn](const std::optional<std::string> &current) -> std::optional<std::string> {
			std::optional<record> r;
			if (current)
				r = decode_record(*current);

			auto next = fn(r);
			if (!next)
				return std::nullopt;
			return encode_record(*next);
		});

		if (!value)
			return std::nullopt;
		return decode_record(*value);
	});
}

void record_gateway::remove(remote_store &store, const std::string &key)
{
	global_logger.log(gateway_ops, "Called remove(" + store.get_name() + ", " + key + ")");

	call<void>(store, key, "remove", [&store, &key] { store.remove(key); });
}
