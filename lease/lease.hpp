#ifndef _LEASE_HPP_
#define _LEASE_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "record.pb.h"
#include "store/remote_store.hpp"
#include "util/notifier.hpp"

using namespace std::chrono;

enum class lease_state {
	claiming,
	active,
	releasing,
	stolen,
	terminal,
};

std::string lease_state_to_string(lease_state st);

/*
 * lease - This process's exclusive hold on one stored record
 *
 * The payload is authoritative in memory while the lease is active; the
 * lease_manager persists it on every save and on release.
 */
class lease {
private:
	remote_store &store;
	std::string key;

	mutable std::mutex m;
	google::protobuf::Struct data;
	record_metadata metadata;
	bool dirty;
	uint64_t load_count;
	lease_state state;
	system_clock::time_point loaded_at;
	system_clock::time_point last_saved;

	std::atomic<bool> save_in_flight;

public:
	/* Fired once, when the lease stops being active for any reason */
	notifier<> released;

	lease(remote_store &s, const std::string &k, const record &loaded, const system_clock::time_point &now);
	~lease(void) = default;

	remote_store &get_store(void) const;
	const std::string &get_key(void) const;

	google::protobuf::Struct get_data(void) const;
	record_metadata get_metadata(void) const;
	uint64_t get_session_load_count(void) const;
	lease_state get_state(void) const;
	bool is_active(void) const;
	bool is_dirty(void) const;
	system_clock::time_point get_loaded_at(void) const;
	system_clock::time_point get_last_saved(void) const;

	/*
	 * update() - Mutate the payload in place
	 *
	 * Throws lease_stolen if the lease is no longer active.
	 */
	void update(const std::function<void(google::protobuf::Struct &)> &fn);
	void set_meta_tag(const std::string &name, const google::protobuf::Value &value);

	/* Used by lease_manager */

	/* Copy of payload and meta tags to write; clears the dirty flag */
	record take_snapshot(void);
	void restore_dirty(void);
	void saved(const record_metadata &latest, const system_clock::time_point &now);

	/* Returns true if the state actually changed */
	bool transition(lease_state from, lease_state to);
	void set_state(lease_state to);

	/* Returns false if a save is already in flight */
	bool begin_save(void);
	void end_save(void);
};

#endif /* _LEASE_HPP_ */
