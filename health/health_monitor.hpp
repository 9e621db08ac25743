#ifndef _HEALTH_MONITOR_HPP_
#define _HEALTH_MONITOR_HPP_

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>

#include "util/clock.hpp"
#include "util/notifier.hpp"

/*
 * health_monitor - Sliding window of remote store issues
 *
 * Critical state is entered when 'issue_count' issues fall inside the
 * last 'issue_window' and left once 'critical_window' has passed without
 * the window reaching that count again. It is advisory only.
 */
class health_monitor {
private:
	std::shared_ptr<clock_source> clk;
	size_t issue_count;
	system_clock::duration issue_window;
	system_clock::duration critical_window;

	std::mutex m;
	std::deque<system_clock::time_point> issues;
	bool critical;
	system_clock::time_point critical_start;

	void prune(const system_clock::time_point &now);

	/* Returns 1 on entering critical state, -1 on leaving it, 0 otherwise */
	int evaluate(const system_clock::time_point &now);

	void fire_transition(int transition);

public:
	notifier<> issue;
	/* true on entry, false on exit */
	notifier<bool> critical_state;

	health_monitor(std::shared_ptr<clock_source> clock, size_t issue_count_for_critical_state,
		       std::chrono::seconds issue_last, std::chrono::seconds critical_state_last);
	~health_monitor(void) = default;

	void report_issue(void);
	void tick(void);

	bool is_critical(void);
	size_t get_issue_count(void);
};

#endif /* _HEALTH_MONITOR_HPP_ */
