#include "auto_save.hpp"

#include <algorithm>

#include "lib/logger/logger.hpp"

auto_save_scheduler::auto_save_scheduler(std::shared_ptr<clock_source> clock, std::chrono::seconds auto_save_interval,
					 std::chrono::seconds dead_lock_assumed_after, task_pool &save_pool, save_fn fn)
	: clk(clock), interval(auto_save_interval), overdue_after(dead_lock_assumed_after / 2),
	  interval_seconds(std::max<int64_t>(1, auto_save_interval.count())), pool(save_pool), save(std::move(fn)), cursor(0)
{
}

void auto_save_scheduler::erase_at(size_t index)
{
	list.erase(list.begin() + index);
	if (index < cursor)
		cursor--;
	if (cursor >= list.size())
		cursor = 0;
}

void auto_save_scheduler::add(std::shared_ptr<lease> l)
{
	std::scoped_lock lock(m);

	if (std::find(list.begin(), list.end(), l) == list.end())
		list.push_back(std::move(l));
}

void auto_save_scheduler::remove(const std::shared_ptr<lease> &l)
{
	std::scoped_lock lock(m);

	auto it = std::find(list.begin(), list.end(), l);
	if (it != list.end())
		erase_at(it - list.begin());
}

size_t auto_save_scheduler::size(void)
{
	std::scoped_lock lock(m);
	return list.size();
}

void auto_save_scheduler::spawn_save(const std::shared_ptr<lease> &l)
{
	if (!l->begin_save()) {
		global_logger.log(auto_save_ops, "Save of " + l->get_key() + " still in flight, skipped");
		return;
	}

	save_fn fn = save;
	pool.spawn([fn, l] {
		try {
			fn(l);
		} catch (...) {
			l->end_save();
			throw;
		}
		l->end_save();
	});
}

void auto_save_scheduler::tick(void)
{
	std::vector<std::shared_ptr<lease>> due;

	{
		std::scoped_lock lock(m);
		auto now = clk->now();

		/* Leases that were released or stolen behind our back */
		for (size_t i = 0; i < list.size();) {
			if (!list[i]->is_active()) {
				global_logger.log(auto_save_ops, "Pruned " + list[i]->get_key() + " (" + lease_state_to_string(list[i]->get_state()) + ")");
				erase_at(i);
			} else {
				i++;
			}
		}

		size_t n = list.size();
		if (n == 0)
			return;

		/* Saves late enough that other processes may soon adopt the record */
		for (const auto &l : list) {
			if (now - l->get_last_saved() >= overdue_after) {
				global_logger.warn(auto_save_ops, "Lease " + l->get_store().get_name() + "/" + l->get_key() + " is overdue for a save");
				due.push_back(l);
			}
		}

		size_t count = (n + interval_seconds - 1) / interval_seconds;
		for (size_t k = 0; k < count; k++) {
			if (cursor >= n)
				cursor = 0;

			std::shared_ptr<lease> pick = list[cursor];
			if (now - pick->get_loaded_at() < interval) {
				pick = nullptr;
				for (size_t j = 1; j < n; j++) {
					cursor = (cursor + 1) % n;
					if (now - list[cursor]->get_loaded_at() >= interval) {
						pick = list[cursor];
						break;
					}
				}
			}

			cursor = (cursor + 1) % n;

			if (pick && std::find(due.begin(), due.end(), pick) == due.end())
				due.push_back(pick);
		}
	}

	for (const auto &l : due)
		spawn_save(l);
}
