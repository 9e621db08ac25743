#ifndef _PROFILE_SERVICE_HPP_
#define _PROFILE_SERVICE_HPP_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include <google/protobuf/struct.pb.h>

#include "channel/write_channel.hpp"
#include "gateway/record_gateway.hpp"
#include "health/health_monitor.hpp"
#include "lease/lease_manager.hpp"
#include "profile_store.hpp"
#include "record.pb.h"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/task_pool.hpp"

#define HEARTBEAT_PERIOD_MS 1000

/*
 * profile_service - One process's session lock runtime
 *
 * Owns the worker pools, the write channel, the health monitor and the
 * lease manager, and runs the heartbeat that drives auto-saves, queue
 * cleanup and critical state recovery. Destroying the service releases
 * every lease it still holds.
 */
class profile_service {
private:
	std::shared_ptr<clock_source> clk;
	settings conf;

	task_pool dispatch;
	write_channel channel;
	health_monitor health;
	record_gateway gateway;
	lease_manager manager;

	std::mutex m;
	std::condition_variable cv;
	bool stopped;
	std::unique_ptr<std::thread> heartbeat_thr;

	void heartbeat(void);

public:
	/* Without 'run_heartbeat' the owner drives tick() itself */
	profile_service(const settings &s, const session_id &self, std::shared_ptr<clock_source> clock = nullptr,
			bool run_heartbeat = true);
	~profile_service(void);

	profile_service(const profile_service &) = delete;
	profile_service &operator=(const profile_service &) = delete;

	/* A fresh session for this process: 'process_id' plus a random job id */
	static session_id make_session(uint64_t process_id);

	std::unique_ptr<profile_store> get_store(remote_store &store, const google::protobuf::Struct &profile_template);

	void tick(void);

	/* Wait for dispatched saves and listener calls */
	void wait_idle(void);

	void shutdown(void);

	lease_manager &get_manager(void);
	health_monitor &get_health(void);
	record_gateway &get_gateway(void);
	write_channel &get_channel(void);
};

#endif /* _PROFILE_SERVICE_HPP_ */
