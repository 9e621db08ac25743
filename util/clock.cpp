#include "clock.hpp"

#include <thread>

void clock_source::sleep_for(const system_clock::duration &d)
{
	sleep_until(now() + d);
}

int64_t clock_source::unix_seconds(void)
{
	return duration_cast<seconds>(now().time_since_epoch()).count();
}

system_clock::time_point real_clock::now(void)
{
	return system_clock::now();
}

void real_clock::sleep_until(const system_clock::time_point &tp)
{
	std::this_thread::sleep_until(tp);
}

void real_clock::wait_until(std::condition_variable &cv, std::unique_lock<std::mutex> &lock, const system_clock::time_point &tp)
{
	cv.wait_until(lock, tp);
}

/* 2020-01-01T00:00:00Z; far enough from the epoch that stale checks never underflow */
manual_clock::manual_clock(void) : current(seconds(1577836800))
{
}

manual_clock::manual_clock(const system_clock::time_point &start) : current(start)
{
}

system_clock::time_point manual_clock::now(void)
{
	std::scoped_lock lock(m);
	return current;
}

void manual_clock::sleep_until(const system_clock::time_point &tp)
{
	std::scoped_lock lock(m);
	if (tp > current)
		current = tp;
}

void manual_clock::wait_until(std::condition_variable &cv, std::unique_lock<std::mutex> &lock, const system_clock::time_point &tp)
{
	lock.unlock();
	sleep_until(tp);
	lock.lock();
}

void manual_clock::advance(const system_clock::duration &d)
{
	std::scoped_lock lock(m);
	current += d;
}

void manual_clock::set(const system_clock::time_point &tp)
{
	std::scoped_lock lock(m);
	current = tp;
}
