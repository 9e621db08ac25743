#ifndef _LOGGER_HPP_
#define _LOGGER_HPP_

#include <iostream>
#include <string>
#include <mutex>

enum code_location {
	write_channel_ops = 0,
	gateway_ops,
	store_ops,
	rados_io_ops,
	lease_ops,
	lease_table_ops,
	auto_save_ops,
	health_ops,
	signal_ops,
	task_pool_ops,
	config_ops,
	service_ops,
	manager_admin
};


class logger {
	std::recursive_mutex logger_mutex;
public:
	logger();

	/* Debug trace, compiled in only with DEBUG */
	void log(enum code_location location, std::string message);

	/* Always printed to stderr */
	void warn(enum code_location location, std::string message);
};

extern logger global_logger;

#endif /* _LOGGER_HPP_ */
