#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "channel/write_channel.hpp"
#include "gateway/record_gateway.hpp"
#include "health/health_monitor.hpp"
#include "store/memory_store.hpp"
#include "store/record_codec.hpp"
#include "test_util.hpp"
#include "util/clock.hpp"
#include "util/errors.hpp"

class record_gateway_test : public ::testing::Test {
protected:
	std::shared_ptr<manual_clock> clk = std::make_shared<manual_clock>();
	memory_store store{"profiles", clk};
	write_channel channel{clk, std::chrono::seconds(0), 2};
	health_monitor health{clk, 5, std::chrono::seconds(120), std::chrono::seconds(120)};
	record_gateway gateway{channel, health, clk,
			       record_gateway::retry_policy{3, std::chrono::milliseconds(1), std::chrono::milliseconds(4)}};

	static record_gateway::updater set_coins(double coins)
	{
		return [coins](const std::optional<record> &current) -> std::optional<record> {
			record r = current ? *current : record();
			(*r.mutable_data()->mutable_fields())["coins"] = number_value(coins);
			return r;
		};
	}
};

TEST_F(record_gateway_test, fetch_of_missing_record_is_empty)
{
	EXPECT_FALSE(gateway.fetch(store, "P1"));
	EXPECT_EQ(health.get_issue_count(), 0u);
}

TEST_F(record_gateway_test, persist_returns_the_stored_record)
{
	auto r = gateway.persist(store, "P1", set_coins(3));

	ASSERT_TRUE(r);
	EXPECT_EQ(get_number(r->data(), "coins"), 3);
	EXPECT_EQ(get_number(stored_record(store, "P1")->data(), "coins"), 3);
}

TEST_F(record_gateway_test, declining_updater_leaves_the_record)
{
	gateway.persist(store, "P1", set_coins(3));
	auto before = store.peek("P1");

	auto r = gateway.persist(store, "P1", [](const std::optional<record> &) -> std::optional<record> { return std::nullopt; });

	ASSERT_TRUE(r);
	EXPECT_EQ(get_number(r->data(), "coins"), 3);
	EXPECT_EQ(store.peek("P1"), before);
}

TEST_F(record_gateway_test, retries_transient_failures)
{
	store.fail_next(2, memory_store::failure::rate_limited);

	auto r = gateway.persist(store, "P1", set_coins(9));

	ASSERT_TRUE(r);
	EXPECT_EQ(get_number(r->data(), "coins"), 9);
	EXPECT_EQ(store.get_call_count("P1"), 3u);
	EXPECT_EQ(health.get_issue_count(), 2u);
}

TEST_F(record_gateway_test, gives_up_after_the_retry_limit)
{
	store.fail_next(3, memory_store::failure::timeout);

	EXPECT_THROW(gateway.persist(store, "P1", set_coins(9)), store_unavailable);
	EXPECT_EQ(store.get_call_count("P1"), 3u);
	EXPECT_EQ(health.get_issue_count(), 3u);
	EXPECT_FALSE(store.peek("P1"));
}

TEST_F(record_gateway_test, backoff_waits_between_attempts)
{
	auto start = clk->now();
	store.fail_next(2, memory_store::failure::timeout);

	gateway.fetch(store, "P1");

	EXPECT_GT(clk->now(), start);
	EXPECT_LE(clk->now() - start, std::chrono::milliseconds(8));
}

TEST_F(record_gateway_test, unavailable_store_is_not_retried)
{
	store.fail_next(1, memory_store::failure::unavailable);

	EXPECT_THROW(gateway.fetch(store, "P1"), store_unavailable);
	EXPECT_EQ(store.get_call_count("P1"), 1u);
	EXPECT_EQ(health.get_issue_count(), 1u);
}

TEST_F(record_gateway_test, oversized_record_is_not_retried)
{
	store.set_max_value_size(16);
	auto big = [](const std::optional<record> &) -> std::optional<record> {
		record r;
		(*r.mutable_data()->mutable_fields())["blob"] = string_value(std::string(64, 'x'));
		return r;
	};

	EXPECT_THROW(gateway.persist(store, "P1", big), payload_too_large);
	EXPECT_EQ(store.get_call_count("P1"), 1u);
}

TEST_F(record_gateway_test, corrupted_record_is_reported)
{
	std::vector<std::string> corrupted;
	gateway.corruption.connect([&corrupted](std::string store_name, std::string key) {
		corrupted.push_back(store_name + "/" + key);
	});
	store.put_raw("P1", "not a record");

	EXPECT_THROW(gateway.fetch(store, "P1"), data_corruption);
	EXPECT_THROW(gateway.persist(store, "P1", set_coins(1)), data_corruption);

	ASSERT_EQ(corrupted.size(), 2u);
	EXPECT_EQ(corrupted[0], "profiles/P1");
	EXPECT_EQ(health.get_issue_count(), 2u);
	EXPECT_EQ(*store.peek("P1"), "not a record");
}

TEST_F(record_gateway_test, remove_deletes_the_record)
{
	gateway.persist(store, "P1", set_coins(1));
	gateway.remove(store, "P1");

	EXPECT_FALSE(gateway.fetch(store, "P1"));
}
