#include <chrono>
#include <future>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "lease/lease_manager.hpp"
#include "store/memory_store.hpp"
#include "store/record_codec.hpp"
#include "test_util.hpp"
#include "util/errors.hpp"

class force_load_test : public ::testing::Test {
protected:
	std::shared_ptr<manual_clock> clk = std::make_shared<manual_clock>();
	memory_store store{"profiles", clk};

	/* The current holder, which never saves unless a test says so */
	std::unique_ptr<process_env> holder;

	void SetUp(void) override
	{
		holder = std::make_unique<process_env>(clk, test_settings(), 2);
	}

	void TearDown(void) override
	{
		holder.reset();
	}

	/* A waiter polls slowly enough for the test thread to act between its steps */
	settings patient_settings(void)
	{
		settings s = test_settings();
		s.force_load_max_steps = 1000000;
		s.dead_lock_assumed_after = 1000000000;
		return s;
	}

	bool force_load_requested_by(const session_id &s)
	{
		auto r = stored_record(store, "P1");
		return r && r->metadata().has_force_load_session() && same_session(r->metadata().force_load_session(), s);
	}
};

TEST_F(force_load_test, free_record_is_taken_at_once)
{
	process_env waiter(clk, test_settings(), 1);
	auto start = clk->now();

	auto l = waiter.manager.force_load(store, "P1", default_template());

	ASSERT_TRUE(l);
	EXPECT_EQ(l->get_session_load_count(), 1u);
	EXPECT_EQ(store.get_call_count("P1"), 1u);
	EXPECT_EQ(clk->now(), start);
	EXPECT_FALSE(stored_record(store, "P1")->metadata().has_force_load_session());
}

TEST_F(force_load_test, unresponsive_holder_is_replaced_at_the_last_step)
{
	settings s = test_settings();
	s.force_load_max_steps = 3;
	process_env waiter(clk, s, 1);

	auto held = holder->manager.claim(store, "P1", default_template());
	size_t calls_before = store.get_call_count("P1");
	auto start = clk->now();

	auto l = waiter.manager.force_load(store, "P1", default_template());

	ASSERT_TRUE(l);
	EXPECT_EQ(store.get_call_count("P1") - calls_before, 4u);
	EXPECT_EQ(clk->now() - start, std::chrono::seconds(3));
	EXPECT_EQ(l->get_session_load_count(), 2u);

	auto r = stored_record(store, "P1");
	EXPECT_TRUE(same_session(r->metadata().active_session(), waiter.manager.get_self()));
	EXPECT_FALSE(r->metadata().has_force_load_session());

	int lost = 0;
	holder->manager.lease_lost.connect([&lost](std::shared_ptr<lease>) { lost++; });
	holder->manager.save(held);
	EXPECT_EQ(held->get_state(), lease_state::stolen);
	EXPECT_EQ(lost, 1);
}

TEST_F(force_load_test, request_is_published_before_waiting)
{
	settings s = test_settings();
	s.force_load_max_steps = 1;
	process_env waiter(clk, s, 1);

	holder->manager.claim(store, "P1", default_template());
	size_t calls_before = store.get_call_count("P1");

	auto l = waiter.manager.force_load(store, "P1", default_template());

	ASSERT_TRUE(l);
	EXPECT_EQ(store.get_call_count("P1") - calls_before, 2u);
}

TEST_F(force_load_test, holder_hands_over_on_its_next_save)
{
	process_env waiter(clk, patient_settings(), 1);
	store.set_latency(std::chrono::milliseconds(1));

	auto held = holder->manager.claim(store, "P1", default_template());
	held->update([](google::protobuf::Struct &data) { (*data.mutable_fields())["coins"] = number_value(77); });
	int lost = 0;
	holder->manager.lease_lost.connect([&lost](std::shared_ptr<lease>) { lost++; });

	auto pending = std::async(std::launch::async, [this, &waiter] {
		return waiter.manager.force_load(store, "P1", default_template());
	});

	ASSERT_TRUE(wait_for([this, &waiter] { return force_load_requested_by(waiter.manager.get_self()); }));
	holder->manager.save(held);

	auto l = pending.get();
	ASSERT_TRUE(l);
	EXPECT_EQ(held->get_state(), lease_state::stolen);
	EXPECT_EQ(lost, 1);
	EXPECT_EQ(get_number(l->get_data(), "coins"), 77);
	EXPECT_EQ(l->get_session_load_count(), 2u);
	EXPECT_TRUE(same_session(stored_record(store, "P1")->metadata().active_session(), waiter.manager.get_self()));
}

TEST_F(force_load_test, cancel_withdraws_the_request)
{
	process_env waiter(clk, patient_settings(), 1);
	store.set_latency(std::chrono::milliseconds(1));

	auto held = holder->manager.claim(store, "P1", default_template());
	cancel_token cancel;

	auto pending = std::async(std::launch::async, [this, &waiter, &cancel] {
		return waiter.manager.force_load(store, "P1", default_template(), &cancel);
	});

	ASSERT_TRUE(wait_for([this, &waiter] { return force_load_requested_by(waiter.manager.get_self()); }));
	cancel.cancel();

	EXPECT_FALSE(pending.get());
	EXPECT_FALSE(waiter.manager.find(store, "P1"));

	auto r = stored_record(store, "P1");
	EXPECT_FALSE(r->metadata().has_force_load_session());
	EXPECT_TRUE(same_session(r->metadata().active_session(), holder->manager.get_self()));

	holder->manager.save(held);
	EXPECT_TRUE(held->is_active());
}

TEST_F(force_load_test, shutdown_withdraws_a_waiting_request)
{
	process_env waiter(clk, patient_settings(), 1);
	store.set_latency(std::chrono::milliseconds(1));

	auto held = holder->manager.claim(store, "P1", default_template());

	auto pending = std::async(std::launch::async, [this, &waiter] {
		return waiter.manager.force_load(store, "P1", default_template());
	});

	ASSERT_TRUE(wait_for([this, &waiter] { return force_load_requested_by(waiter.manager.get_self()); }));
	waiter.manager.shutdown();

	EXPECT_THROW(pending.get(), service_stopping);
	EXPECT_FALSE(waiter.manager.find(store, "P1"));

	auto r = stored_record(store, "P1");
	EXPECT_FALSE(r->metadata().has_force_load_session());
	EXPECT_TRUE(same_session(r->metadata().active_session(), holder->manager.get_self()));
	EXPECT_TRUE(held->is_active());
}

TEST_F(force_load_test, later_request_interrupts_an_earlier_one)
{
	process_env first(clk, patient_settings(), 1);
	settings s = test_settings();
	s.force_load_max_steps = 3;
	s.dead_lock_assumed_after = 1000000000;
	process_env second(clk, s, 3);
	store.set_latency(std::chrono::milliseconds(1));

	holder->manager.claim(store, "P1", default_template());

	auto first_pending = std::async(std::launch::async, [this, &first] {
		return first.manager.force_load(store, "P1", default_template());
	});
	ASSERT_TRUE(wait_for([this, &first] { return force_load_requested_by(first.manager.get_self()); }));

	auto l = second.manager.force_load(store, "P1", default_template());
	ASSERT_TRUE(l);

	try {
		first_pending.get();
		FAIL() << "interrupted force load returned";
	} catch (const force_load_interrupted &e) {
		EXPECT_EQ(e.holder_process_id, 3u);
	}
	EXPECT_FALSE(first.manager.find(store, "P1"));
	EXPECT_TRUE(same_session(stored_record(store, "P1")->metadata().active_session(), second.manager.get_self()));
}
