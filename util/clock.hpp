#ifndef _CLOCK_HPP_
#define _CLOCK_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

using namespace std::chrono;

/*
 * clock_source - Time used by every timed decision in profd
 *
 * Record timestamps, write cooldowns, retry backoff, issue windows and
 * force load steps all read the same clock so they can be driven by
 * manual_clock in tests.
 */
class clock_source {
public:
	virtual ~clock_source(void) = default;

	virtual system_clock::time_point now(void) = 0;
	virtual void sleep_until(const system_clock::time_point &tp) = 0;

	/*
	 * wait_until() - Block on 'cv' until notified or 'tp' is reached
	 *
	 * 'lock' must hold the mutex guarding the waited-for state. Callers
	 * re-check their condition afterwards.
	 */
	virtual void wait_until(std::condition_variable &cv, std::unique_lock<std::mutex> &lock,
				const system_clock::time_point &tp) = 0;

	void sleep_for(const system_clock::duration &d);
	int64_t unix_seconds(void);
};

class real_clock : public clock_source {
public:
	system_clock::time_point now(void) override;
	void sleep_until(const system_clock::time_point &tp) override;
	void wait_until(std::condition_variable &cv, std::unique_lock<std::mutex> &lock,
			const system_clock::time_point &tp) override;
};

/*
 * manual_clock - Simulated time
 *
 * Time only moves through advance(), set() or sleep_until(). A sleeper
 * does not block: it moves the clock forward to its deadline. So does a
 * timed wait.
 */
class manual_clock : public clock_source {
private:
	std::mutex m;
	system_clock::time_point current;

public:
	manual_clock(void);
	explicit manual_clock(const system_clock::time_point &start);

	system_clock::time_point now(void) override;
	void sleep_until(const system_clock::time_point &tp) override;
	void wait_until(std::condition_variable &cv, std::unique_lock<std::mutex> &lock,
			const system_clock::time_point &tp) override;

	void advance(const system_clock::duration &d);
	void set(const system_clock::time_point &tp);
};

#endif /* _CLOCK_HPP_ */
