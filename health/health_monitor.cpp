#include "health_monitor.hpp"

#include "lib/logger/logger.hpp"

health_monitor::health_monitor(std::shared_ptr<clock_source> clock, size_t issue_count_for_critical_state,
			       std::chrono::seconds issue_last, std::chrono::seconds critical_state_last)
	: clk(clock), issue_count(issue_count_for_critical_state), issue_window(issue_last),
	  critical_window(critical_state_last), critical(false)
{
}

void health_monitor::prune(const system_clock::time_point &now)
{
	while (!issues.empty() && now - issues.front() > issue_window)
		issues.pop_front();
}

int health_monitor::evaluate(const system_clock::time_point &now)
{
	prune(now);

	if (!critical) {
		if (issues.size() >= issue_count) {
			critical = true;
			critical_start = now;
			return 1;
		}
	} else {
		if (issues.size() >= issue_count) {
			critical_start = now;
		} else if (now - critical_start >= critical_window) {
			critical = false;
			return -1;
		}
	}

	return 0;
}

void health_monitor::fire_transition(int transition)
{
	if (transition > 0) {
		global_logger.warn(health_ops, "Entered critical state: remote store calls keep failing");
		critical_state.fire(true);
	} else if (transition < 0) {
		global_logger.warn(health_ops, "Left critical state");
		critical_state.fire(false);
	}
}

void health_monitor::report_issue(void)
{
	int transition;

	{
		std::scoped_lock lock(m);
		auto now = clk->now();
		issues.push_back(now);
		transition = evaluate(now);
		global_logger.log(health_ops, "Issue reported (" + std::to_string(issues.size()) + " in window)");
	}

	issue.fire();
	fire_transition(transition);
}

void health_monitor::tick(void)
{
	int transition;

	{
		std::scoped_lock lock(m);
		transition = evaluate(clk->now());
	}

	fire_transition(transition);
}

bool health_monitor::is_critical(void)
{
	std::scoped_lock lock(m);
	return critical;
}

size_t health_monitor::get_issue_count(void)
{
	std::scoped_lock lock(m);
	prune(clk->now());
	return issues.size();
}
