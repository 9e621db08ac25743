#ifndef _LEASE_MANAGER_HPP_
#define _LEASE_MANAGER_HPP_

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "auto_save.hpp"
#include "channel/write_channel.hpp"
#include "gateway/record_gateway.hpp"
#include "lease.hpp"
#include "lease_table.hpp"
#include "record.pb.h"
#include "store/remote_store.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/notifier.hpp"
#include "util/task_pool.hpp"

enum class not_released_action {
	repeat,
	cancel,
	force_load,
	steal,
};

using not_released_handler = std::function<not_released_action(const session_id &holder)>;

class cancel_token {
private:
	std::atomic<bool> flag{false};

public:
	void cancel(void) { flag = true; }
	bool is_cancelled(void) const { return flag; }
};

/*
 * lease_manager - Session lock protocol over record metadata
 *
 * A record is leased by the session in its metadata.active_session, as
 * long as that session keeps metadata.last_update fresh. Every transition
 * is a single optimistic read-modify-write through the record gateway.
 */
class lease_manager {
private:
	enum class claim_mode {
		plain,
		/* also leave our session in force_load_session */
		request_force_load,
		/* take over if force_load_session is still ours */
		steal_if_requested,
		/* take over unconditionally */
		steal,
	};

	struct claim_outcome {
		std::shared_ptr<lease> l;
		record latest;
	};

	record_gateway &gateway;
	write_channel &channel;
	task_pool &dispatch;
	std::shared_ptr<clock_source> clk;
	settings conf;
	session_id self;

	lease_table table;
	auto_save_scheduler auto_save;
	std::atomic<bool> stopping;

	/* claim(), force_load() and steal() calls shutdown() has to wait for */
	std::mutex claims_m;
	std::condition_variable claims_cv;
	size_t claims_in_flight;

	/* Counts one claim as in flight; refused once shutdown() has begun */
	class claim_scope {
	private:
		lease_manager &mgr;

	public:
		claim_scope(lease_manager &manager, remote_store &store, const std::string &key);
		~claim_scope(void);

		claim_scope(const claim_scope &) = delete;
		claim_scope &operator=(const claim_scope &) = delete;
	};

	claim_outcome try_claim(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl, claim_mode mode);
	void withdraw_force_load(remote_store &store, const std::string &key);
	void save_internal(const std::shared_ptr<lease> &l, bool release);
	void lose(const std::shared_ptr<lease> &l, const std::optional<record> &latest);
	void reserve(remote_store &store, const std::string &key);

public:
	/* A lease this process held was taken by another session */
	notifier<std::shared_ptr<lease>> lease_lost;

	lease_manager(record_gateway &gw, write_channel &ch, task_pool &dispatch_pool, std::shared_ptr<clock_source> clock,
		      const settings &s, const session_id &self_session);
	~lease_manager(void) = default;

	const session_id &get_self(void) const;

	/*
	 * claim() - One attempt to lease 'key'
	 *
	 * Takes the record when it is unleased, leased by this session, or its
	 * holder has not updated it for dead_lock_assumed_after seconds. A
	 * missing record is created from 'tmpl'; fields missing from the
	 * payload are filled from 'tmpl'.
	 *
	 * Throws session_locked (record left untouched), already_loaded,
	 * service_stopping, store_unavailable or data_corruption.
	 */
	std::shared_ptr<lease> claim(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl);

	/*
	 * force_load() - Claim, escalating to a takeover
	 *
	 * Publishes this session in force_load_session, then polls once per
	 * second. A holder that sees the request on its next save gives the
	 * record up. At step force_load_max_steps the record is taken
	 * regardless of the holder.
	 *
	 * Returns nullptr if 'cancel' fires before the takeover is written.
	 * Throws force_load_interrupted if another session requested a force
	 * load after us.
	 */
	std::shared_ptr<lease> force_load(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl,
					  const cancel_token *cancel = nullptr);

	/* Take the record at once, whoever holds it */
	std::shared_ptr<lease> steal(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl);

	/* Claim loop asking 'handler' what to do while another session holds the record */
	std::shared_ptr<lease> load(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl,
				    const not_released_handler &handler);

	/* Persist the payload and refresh the lock; a lost lock ends the lease */
	void save(const std::shared_ptr<lease> &l);

	/* Final save, clears the lock and waits for queued writes of the key */
	void release(const std::shared_ptr<lease> &l);

	std::optional<record> view(remote_store &store, const std::string &key);
	void wipe(remote_store &store, const std::string &key);

	/*
	 * shutdown() - Refuse new claims and release every held lease
	 *
	 * Waits for claims already in flight first. A claim whose write lands
	 * after shutdown() began gives the record back at once.
	 */
	void shutdown(void);

	void tick(void);

	size_t get_active_count(void);
	std::shared_ptr<lease> find(remote_store &store, const std::string &key);
};

/* Releases the lease when leaving scope */
class lease_guard {
private:
	lease_manager &manager;
	std::shared_ptr<lease> l;

public:
	lease_guard(lease_manager &mgr, std::shared_ptr<lease> held);
	~lease_guard(void);

	lease_guard(const lease_guard &) = delete;
	lease_guard &operator=(const lease_guard &) = delete;

	const std::shared_ptr<lease> &get(void) const;
	lease *operator->(void) const;
};

#endif /* _LEASE_MANAGER_HPP_ */
