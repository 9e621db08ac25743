#include "rados_io.hpp"

#include <cerrno>
#include <cstdlib>

#include "lib/logger/logger.hpp"

void rados_io::raise(const string &what, const string &key, int ret)
{
	string msg = "rados_io::" + what + "() failed (key: \"" + key + "\", ret: " + std::to_string(ret) + ")";

	switch (-ret) {
	case ETIMEDOUT:
	case EAGAIN:
	case EBUSY:
	case EINTR:
		throw transient_store_error(msg);
	case EFBIG:
	case E2BIG:
		throw payload_too_large(msg);
	default:
		throw store_unavailable(msg);
	}
}

rados_io::rados_io(const conn_info &ci, string pool) : name(pool)
{
	int ret;

	if ((ret = cluster.init2(ci.user.c_str(), ci.cluster.c_str(), ci.flags)) < 0) {
		throw runtime_error("rados_io::rados_io() failed "
				"(couldn't initialize the cluster handle)");
	}
	global_logger.log(rados_io_ops, "Initialized the cluster handle. (user: \"" + ci.user + "\", cluster: \"" + ci.cluster + "\")");

	if ((ret = cluster.conf_read_file(ci.conf_path.c_str())) < 0) {
		cluster.shutdown();
		throw runtime_error("rados_io::rados_io() failed "
				"(couldn't read the Ceph configuration file)");
	}
	global_logger.log(rados_io_ops, "Read a Ceph configuration file.");

	if ((ret = cluster.connect()) < 0) {
		cluster.shutdown();
		throw runtime_error("rados_io::rados_io() failed "
				"(couldn't connect to cluster)");
	}
	global_logger.log(rados_io_ops, "Connected to the cluster.");

	if ((ret = cluster.ioctx_create(pool.c_str(), ioctx)) < 0) {
		cluster.shutdown();
		throw runtime_error("rados_io::rados_io() failed "
				"(couldn't set up ioctx)");
	}
	global_logger.log(rados_io_ops, "Created an I/O context. "
			"(pool: \"" + pool + "\")");
}

rados_io::~rados_io(void)
{
	ioctx.close();
	global_logger.log(rados_io_ops, "Closed the connection.");

	cluster.shutdown();
	global_logger.log(rados_io_ops, "Shut down the handle.");
}

const string &rados_io::get_name(void) const
{
	return name;
}

bool rados_io::read_obj(const string &key, string &value, uint64_t &version)
{
	librados::ObjectReadOperation op;
	librados::bufferlist data_bl, ver_bl;
	int data_ret = 0, ver_ret = 0;

	op.read(0, RADOS_MAX_VALUE_SIZE + 1, &data_bl, &data_ret);
	op.getxattr(RADOS_VERSION_XATTR, &ver_bl, &ver_ret);
	op.set_op_flags2(LIBRADOS_OP_FLAG_FAILOK);

	int ret = ioctx.operate(key, &op, nullptr);
	if (ret == -ENOENT)
		return false;
	if (ret < 0)
		raise("read_obj", key, ret);

	value.assign(data_bl.c_str(), data_bl.length());
	version = ver_ret < 0 ? 0 : std::strtoull(ver_bl.to_str().c_str(), nullptr, 10);

	return true;
}

std::optional<string> rados_io::get(const string &key)
{
	global_logger.log(rados_io_ops, "Called rados_io::get()");
	global_logger.log(rados_io_ops, "key : " + key);

	string value;
	uint64_t version;

	if (!read_obj(key, value, version)) {
		global_logger.log(rados_io_ops, "The object with key \"" + key + "\" doesn't exist.");
		return std::nullopt;
	}

	return value;
}

std::optional<string> rados_io::update(const string &key, const transform_fn &transform)
{
	global_logger.log(rados_io_ops, "Called rados_io::update()");
	global_logger.log(rados_io_ops, "key : " + key);

	while (true) {
		std::optional<string> current;
		string value;
		uint64_t version = 0;

		if (read_obj(key, value, version))
			current = value;

		auto next = transform(current);
		if (!next)
			return current;

		if (next->size() > RADOS_MAX_VALUE_SIZE)
			throw payload_too_large("rados_io::update() failed (value of " + std::to_string(next->size()) + " bytes, key: \"" + key + "\")");

		librados::ObjectWriteOperation op;
		librados::bufferlist data_bl, ver_bl;

		data_bl.append(*next);
		ver_bl.append(std::to_string(version + 1));

		if (current) {
			/* a missing xattr compares as 0 */
			op.cmpxattr(RADOS_VERSION_XATTR, LIBRADOS_CMPXATTR_OP_EQ, version);
		} else {
			op.create(true);
		}
		op.write_full(data_bl);
		op.setxattr(RADOS_VERSION_XATTR, ver_bl);

		int ret = ioctx.operate(key, &op);
		if (ret == -ECANCELED || ret == -EEXIST || (current && ret == -ENOENT)) {
			global_logger.log(rados_io_ops, "Lost a race on \"" + key + "\", retrying");
			continue;
		}
		if (ret < 0)
			raise("update", key, ret);

		global_logger.log(rados_io_ops, "Wrote an object. (key: \"" + key + "\")");
		return next;
	}
}

void rados_io::remove(const string &key)
{
	global_logger.log(rados_io_ops, "Called rados_io::remove()");
	global_logger.log(rados_io_ops, "key : " + key);

	int ret = ioctx.remove(key);

	if (ret == -ENOENT) {
		global_logger.log(rados_io_ops, "Tried to remove a non-existent object. (key: \"" + key + "\")");
	} else if (ret < 0) {
		raise("remove", key, ret);
	} else {
		global_logger.log(rados_io_ops, "Removed an object. (key: \"" + key + "\")");
	}
}
