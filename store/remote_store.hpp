#ifndef _REMOTE_STORE_HPP_
#define _REMOTE_STORE_HPP_

#include <functional>
#include <optional>
#include <string>

#include "util/errors.hpp"

/*
 * remote_store - Key-value service shared by every profd process
 *
 * Implementations raise transient_store_error for rate limits and timeouts,
 * payload_too_large and store_unavailable for failures that retrying will
 * not fix. Calls for the same key are rate-limited by the service.
 */
class remote_store {
public:
	using transform_fn = std::function<std::optional<std::string>(const std::optional<std::string> &current)>;

	virtual ~remote_store(void) = default;

	virtual const std::string &get_name(void) const = 0;

	virtual std::optional<std::string> get(const std::string &key) = 0;

	/*
	 * update() - Atomic read-modify-write
	 *
	 * 'transform' receives the current value (nullopt if the key is absent)
	 * and returns the value to store, or nullopt to leave the key untouched.
	 * It may run more than once when a concurrent writer wins the race.
	 * Exceptions thrown by 'transform' cancel the write and propagate.
	 *
	 * Returns the value stored after the call.
	 */
	virtual std::optional<std::string> update(const std::string &key, const transform_fn &transform) = 0;

	virtual void remove(const std::string &key) = 0;
};

#endif /* _REMOTE_STORE_HPP_ */
