#include "profile_service.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "lib/logger/logger.hpp"

static std::shared_ptr<clock_source> default_clock(std::shared_ptr<clock_source> clock)
{
	return clock ? clock : std::make_shared<real_clock>();
}

static const settings &validated(const settings &s)
{
	s.validate();
	return s;
}

profile_service::profile_service(const settings &s, const session_id &self, std::shared_ptr<clock_source> clock, bool run_heartbeat)
	: clk(default_clock(clock)), conf(validated(s)),
	  dispatch("dispatch", conf.dispatch_workers),
	  channel(clk, std::chrono::seconds(conf.write_cooldown), conf.write_workers),
	  health(clk, conf.issue_count_for_critical_state, std::chrono::seconds(conf.issue_window), std::chrono::seconds(conf.critical_state_window)),
	  gateway(channel, health, clk, record_gateway::retry_policy{conf.retry_attempts, std::chrono::milliseconds(conf.retry_base_delay_ms),
								   std::chrono::milliseconds(conf.retry_max_delay_ms)}),
	  manager(gateway, channel, dispatch, clk, conf, self),
	  stopped(false)
{
	health.issue.set_dispatcher(&dispatch);
	health.critical_state.set_dispatcher(&dispatch);
	gateway.corruption.set_dispatcher(&dispatch);
	manager.lease_lost.set_dispatcher(&dispatch);

	if (run_heartbeat)
		heartbeat_thr = std::make_unique<std::thread>(&profile_service::heartbeat, this);

	global_logger.log(service_ops, "Started session " + session_to_string(self));
}

profile_service::~profile_service(void)
{
	shutdown();
}

session_id profile_service::make_session(uint64_t process_id)
{
	boost::uuids::random_generator generator;

	session_id s;
	s.set_process_id(process_id);
	s.set_job_id(boost::uuids::to_string(generator()));

	return s;
}

std::unique_ptr<profile_store> profile_service::get_store(remote_store &store, const google::protobuf::Struct &profile_template)
{
	return std::make_unique<profile_store>(manager, store, profile_template);
}

void profile_service::heartbeat(void)
{
	std::chrono::milliseconds period(HEARTBEAT_PERIOD_MS);

	std::unique_lock lock(m);
	while (!stopped) {
		auto cycle_end = std::chrono::steady_clock::now() + period;

		lock.unlock();
		try {
			tick();
		} catch (const std::exception &e) {
			global_logger.warn(service_ops, std::string("Heartbeat failed: ") + e.what());
		}
		lock.lock();

		cv.wait_until(lock, cycle_end, [this] { return stopped; });
	}
}

void profile_service::tick(void)
{
	channel.tick();
	manager.tick();
	health.tick();
}

void profile_service::wait_idle(void)
{
	dispatch.wait_idle();
}

void profile_service::shutdown(void)
{
	{
		std::scoped_lock lock(m);
		if (stopped)
			return;
		stopped = true;
	}
	cv.notify_all();

	if (heartbeat_thr) {
		heartbeat_thr->join();
		heartbeat_thr.reset();
	}

	manager.shutdown();
	dispatch.wait_idle();
	channel.stop();

	health.issue.set_dispatcher(nullptr);
	health.critical_state.set_dispatcher(nullptr);
	gateway.corruption.set_dispatcher(nullptr);
	manager.lease_lost.set_dispatcher(nullptr);
	dispatch.stop();

	global_logger.log(service_ops, "Stopped");
}

lease_manager &profile_service::get_manager(void)
{
	return manager;
}

health_monitor &profile_service::get_health(void)
{
	return health;
}

record_gateway &profile_service::get_gateway(void)
{
	return gateway;
}

write_channel &profile_service::get_channel(void)
{
	return channel;
}
