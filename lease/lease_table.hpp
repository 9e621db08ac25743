#ifndef _LEASE_TABLE_HPP_
#define _LEASE_TABLE_HPP_

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <boost/functional/hash.hpp>
#include <tsl/robin_map.h>

#include "channel/write_channel.hpp"
#include "lease.hpp"

/*
 * lease_table - Leases held or being claimed by this process
 *
 * A key is reserved before the claim goes to the store, so two threads of
 * this process never claim the same key at once.
 */
class lease_table {
private:
	std::shared_mutex sm;
	tsl::robin_map<channel_key, std::shared_ptr<lease>, boost::hash<channel_key>> map;

public:
	lease_table(void) = default;
	~lease_table(void) = default;

	/*
	 * reserve() - Claim the slot of (store, key)
	 *
	 * On success
	 * - Return 0
	 *
	 * On failure
	 * - Return -1 (the key is already held or being claimed)
	 */
	int reserve(const std::string &store, const std::string &key);

	/* Attach the claimed lease to a reserved slot */
	void fill(const std::string &store, const std::string &key, std::shared_ptr<lease> l);

	/* Drop the slot, but only if it still belongs to 'l' (nullptr: a bare reservation) */
	void erase(const std::string &store, const std::string &key, const std::shared_ptr<lease> &l);

	std::shared_ptr<lease> find(const std::string &store, const std::string &key);
	std::vector<std::shared_ptr<lease>> get_leases(void);
	size_t size(void);
};

#endif /* _LEASE_TABLE_HPP_ */
