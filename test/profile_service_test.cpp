#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "service/profile_service.hpp"
#include "store/memory_store.hpp"
#include "store/record_codec.hpp"
#include "test_util.hpp"
#include "util/errors.hpp"

class profile_service_test : public ::testing::Test {
protected:
	std::shared_ptr<manual_clock> clk = std::make_shared<manual_clock>();
	memory_store store{"profiles", clk};
	settings conf = test_settings();

	std::unique_ptr<profile_service> make_service(uint64_t process_id)
	{
		return std::make_unique<profile_service>(conf, profile_service::make_session(process_id), clk, false);
	}
};

TEST_F(profile_service_test, sessions_get_distinct_job_ids)
{
	auto a = profile_service::make_session(1);
	auto b = profile_service::make_session(1);

	EXPECT_EQ(a.process_id(), 1u);
	EXPECT_EQ(a.job_id().size(), 36u);
	EXPECT_FALSE(same_session(a, b));
}

TEST_F(profile_service_test, rejects_invalid_settings)
{
	conf.retry_attempts = 0;

	EXPECT_THROW(make_service(1), invalid_configuration);
}

TEST_F(profile_service_test, heartbeat_saves_active_leases)
{
	auto service = make_service(1);
	auto profiles = service->get_store(store, default_template());

	auto l = profiles->claim("P1");
	l->update([](google::protobuf::Struct &data) { (*data.mutable_fields())["coins"] = number_value(12); });

	service->tick();
	service->wait_idle();
	EXPECT_EQ(get_number(stored_record(store, "P1")->data(), "coins"), 0);

	clk->advance(std::chrono::seconds(conf.auto_save_interval));
	service->tick();
	service->wait_idle();

	auto r = stored_record(store, "P1");
	EXPECT_EQ(get_number(r->data(), "coins"), 12);
	EXPECT_EQ(r->metadata().last_update(), clk->unix_seconds());
	EXPECT_TRUE(l->is_active());
}

TEST_F(profile_service_test, heartbeat_notices_a_stolen_lease)
{
	auto a = make_service(1);
	auto b = make_service(2);
	auto a_profiles = a->get_store(store, default_template());
	auto b_profiles = b->get_store(store, default_template());

	std::atomic<int> lost(0);
	a->get_manager().lease_lost.connect([&lost](std::shared_ptr<lease>) { lost++; });

	auto la = a_profiles->claim("P1");
	clk->advance(std::chrono::seconds(conf.auto_save_interval));
	auto lb = b_profiles->steal("P1");

	a->tick();
	a->wait_idle();

	EXPECT_EQ(la->get_state(), lease_state::stolen);
	EXPECT_EQ(lost.load(), 1);
	EXPECT_TRUE(lb->is_active());

	a->tick();
	a->wait_idle();
	EXPECT_EQ(a->get_manager().get_active_count(), 0u);
}

TEST_F(profile_service_test, idle_write_queues_are_dropped)
{
	conf.write_cooldown = 7;
	auto service = make_service(1);
	auto profiles = service->get_store(store, default_template());

	profiles->view("P1");
	service->get_channel().drain("profiles", "P1");
	EXPECT_TRUE(service->get_channel().has_queue("profiles", "P1"));

	clk->advance(std::chrono::seconds(7));
	service->tick();
	EXPECT_FALSE(service->get_channel().has_queue("profiles", "P1"));
}

TEST_F(profile_service_test, critical_state_is_announced)
{
	auto service = make_service(1);
	auto profiles = service->get_store(store, default_template());

	std::mutex m;
	std::vector<bool> transitions;
	service->get_health().critical_state.connect([&m, &transitions](bool entered) {
		std::scoped_lock lock(m);
		transitions.push_back(entered);
	});

	store.fail_next(conf.issue_count_for_critical_state, memory_store::failure::unavailable);
	for (int i = 0; i < conf.issue_count_for_critical_state; i++)
		EXPECT_THROW(profiles->claim("P1"), store_unavailable);
	service->wait_idle();

	EXPECT_TRUE(service->get_health().is_critical());
	{
		std::scoped_lock lock(m);
		ASSERT_EQ(transitions.size(), 1u);
		EXPECT_TRUE(transitions[0]);
	}

	clk->advance(std::chrono::seconds(conf.critical_state_window + 1));
	service->tick();
	service->wait_idle();

	std::scoped_lock lock(m);
	ASSERT_EQ(transitions.size(), 2u);
	EXPECT_FALSE(transitions[1]);
}

TEST_F(profile_service_test, view_is_reconciled_with_the_template)
{
	auto service = make_service(1);

	record r;
	(*r.mutable_data()->mutable_fields())["coins"] = number_value(4);
	store_record(store, "P1", r);

	google::protobuf::Struct tmpl = default_template();
	(*tmpl.mutable_fields())["gems"] = number_value(2);
	auto profiles = service->get_store(store, tmpl);

	auto viewed = profiles->view("P1");
	ASSERT_TRUE(viewed);
	EXPECT_EQ(get_number(viewed->data(), "coins"), 4);
	EXPECT_EQ(get_number(viewed->data(), "gems"), 2);
	EXPECT_FALSE(profiles->view("P2"));
	EXPECT_EQ(stored_record(store, "P1")->data().fields().count("gems"), 0u);
}

TEST_F(profile_service_test, wipe_removes_the_profile)
{
	auto service = make_service(1);
	auto profiles = service->get_store(store, default_template());

	auto l = profiles->claim("P1");
	profiles->release(l);
	profiles->wipe("P1");

	EXPECT_FALSE(store.peek("P1"));
}

TEST_F(profile_service_test, shutdown_releases_every_lease)
{
	auto service = make_service(1);
	auto profiles = service->get_store(store, default_template());

	std::set<std::string> keys{"P1", "P2", "P3", "P4", "P5"};
	std::vector<std::shared_ptr<lease>> held;
	for (const auto &key : keys)
		held.push_back(profiles->claim(key));
	held[0]->update([](google::protobuf::Struct &data) { (*data.mutable_fields())["coins"] = number_value(3); });

	service.reset();

	for (const auto &key : keys) {
		auto r = stored_record(store, key);
		EXPECT_FALSE(r->metadata().has_active_session()) << key;
	}
	EXPECT_EQ(get_number(stored_record(store, "P1")->data(), "coins"), 3);
	for (const auto &l : held)
		EXPECT_EQ(l->get_state(), lease_state::terminal);

	auto other = make_service(2);
	EXPECT_TRUE(other->get_store(store, default_template())->claim("P3"));
}
