#ifndef _MQUEUE_HPP_
#define _MQUEUE_HPP_

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>

/*
 * mqueue - Blocking FIFO shared by producers and worker threads
 *
 * After close(), issue() is rejected and dispatch() keeps handing out what
 * was queued before returning nullopt, so workers drain it and exit.
 */
template <typename T>
class mqueue {
private:
	std::mutex m;
	std::condition_variable cv;
	std::queue<T> q;
	bool closed = false;

public:
	void issue(T value)
	{
		std::scoped_lock lock(m);

		if (closed)
			throw std::runtime_error("mqueue::issue() failed (queue is closed)");

		q.push(std::move(value));
		cv.notify_one();
	}

	std::optional<T> dispatch(void)
	{
		std::unique_lock lock(m);

		cv.wait(lock, [this] { return closed || !q.empty(); });
		if (q.empty())
			return std::nullopt;

		std::optional<T> value(std::move(q.front()));
		q.pop();

		return value;
	}

	void close(void)
	{
		std::scoped_lock lock(m);

		closed = true;
		cv.notify_all();
	}

	size_t size(void)
	{
		std::scoped_lock lock(m);
		return q.size();
	}
};

#endif /* _MQUEUE_HPP_ */
