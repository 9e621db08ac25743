#ifndef _ERRORS_HPP_
#define _ERRORS_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

using std::runtime_error;
using std::string;

/* Remote store failures */

class store_error : public runtime_error {
public:
	explicit store_error(const string &msg) : runtime_error(msg) {}
};

/* Rate limit or timeout; retried by record_gateway */
class transient_store_error : public store_error {
public:
	explicit transient_store_error(const string &msg) : store_error(msg) {}
};

/* Retries exhausted, or a failure that retrying cannot fix */
class store_unavailable : public store_error {
public:
	explicit store_unavailable(const string &msg) : store_error(msg) {}
};

class payload_too_large : public store_unavailable {
public:
	explicit payload_too_large(const string &msg) : store_unavailable(msg) {}
};

/* The stored bytes could not be decoded as a record */
class data_corruption : public store_error {
public:
	explicit data_corruption(const string &msg) : store_error(msg) {}
};

/* Session lock failures */

class session_locked : public runtime_error {
public:
	const uint64_t holder_process_id;
	const string holder_job_id;

	session_locked(const string &msg, uint64_t process_id, const string &job_id)
		: runtime_error(msg), holder_process_id(process_id), holder_job_id(job_id) {}
};

/* Another process replaced our force_load_session while we were waiting */
class force_load_interrupted : public session_locked {
public:
	force_load_interrupted(const string &msg, uint64_t process_id, const string &job_id)
		: session_locked(msg, process_id, job_id) {}
};

class already_loaded : public runtime_error {
public:
	explicit already_loaded(const string &msg) : runtime_error(msg) {}
};

class lease_stolen : public runtime_error {
public:
	explicit lease_stolen(const string &msg) : runtime_error(msg) {}
};

class service_stopping : public runtime_error {
public:
	explicit service_stopping(const string &msg) : runtime_error(msg) {}
};

class invalid_configuration : public runtime_error {
public:
	explicit invalid_configuration(const string &msg) : runtime_error(msg) {}
};

#endif /* _ERRORS_HPP_ */
