#include "lease_table.hpp"

#include "lib/logger/logger.hpp"

int lease_table::reserve(const std::string &store, const std::string &key)
{
	global_logger.log(lease_table_ops, "Called reserve(" + store + ", " + key + ")");

	std::unique_lock lock(sm);
	auto ret = map.insert({channel_key(store, key), nullptr});

	return ret.second ? 0 : -1;
}

void lease_table::fill(const std::string &store, const std::string &key, std::shared_ptr<lease> l)
{
	std::unique_lock lock(sm);
	map[channel_key(store, key)] = std::move(l);
}

void lease_table::erase(const std::string &store, const std::string &key, const std::shared_ptr<lease> &l)
{
	global_logger.log(lease_table_ops, "Called erase(" + store + ", " + key + ")");

	std::unique_lock lock(sm);
	auto it = map.find(channel_key(store, key));
	if (it != map.end() && it->second == l)
		map.erase(it);
}

std::shared_ptr<lease> lease_table::find(const std::string &store, const std::string &key)
{
	std::shared_lock lock(sm);
	auto it = map.find(channel_key(store, key));
	if (it == map.end())
		return nullptr;

	return it->second;
}

std::vector<std::shared_ptr<lease>> lease_table::get_leases(void)
{
	std::vector<std::shared_ptr<lease>> leases;

	std::shared_lock lock(sm);
	for (const auto &p : map) {
		if (p.second)
			leases.push_back(p.second);
	}

	return leases;
}

size_t lease_table::size(void)
{
	std::shared_lock lock(sm);
	return map.size();
}
