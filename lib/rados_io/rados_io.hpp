#ifndef _RADOS_IO_HPP_
#define _RADOS_IO_HPP_

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <rados/librados.hpp>

#include "store/remote_store.hpp"

using std::runtime_error;
using std::string;

#define RADOS_VERSION_XATTR "profd.version"
#define RADOS_MAX_VALUE_SIZE (4194304)

/*
 * rados_io - remote_store on a RADOS pool
 *
 * One object per key. The object's version xattr is compared and bumped in
 * the same write operation, so a transform computed from a stale read is
 * never committed; the read-modify-write is repeated instead.
 */
class rados_io : public remote_store {
private:
	librados::Rados cluster;
	librados::IoCtx ioctx;
	string name;

	/* Returns false if the object doesn't exist */
	bool read_obj(const string &key, string &value, uint64_t &version);

	[[noreturn]] void raise(const string &what, const string &key, int ret);

public:
	struct conn_info {
		string user;
		string cluster;
		string conf_path;
		int64_t flags;
	};

	rados_io(const conn_info &ci, string pool);
	~rados_io(void);

	const string &get_name(void) const override;
	std::optional<string> get(const string &key) override;
	std::optional<string> update(const string &key, const transform_fn &transform) override;
	void remove(const string &key) override;
};

#endif /* _RADOS_IO_HPP_ */
