#include "logger.hpp"

#define CYAN "\033[0;36m"
#define YELLOW "\033[0;33m"
#define RESET "\033[0m"

static std::string location_to_string(enum code_location location)
{
	switch (location) {
	case write_channel_ops:
		return "write_channel";
	case gateway_ops:
		return "record_gateway";
	case store_ops:
		return "memory_store";
	case rados_io_ops:
		return "rados_io_ops";
	case lease_ops:
		return "lease_operation";
	case lease_table_ops:
		return "lease_table";
	case auto_save_ops:
		return "auto_save";
	case health_ops:
		return "health_monitor";
	case signal_ops:
		return "signal";
	case task_pool_ops:
		return "task_pool";
	case config_ops:
		return "config";
	case service_ops:
		return "profile_service";
	case manager_admin:
		return "manager_admin";
	default:
		return "Unknown";
	}
}

logger::logger()
{
}

void logger::log(enum code_location location, std::string message)
{
#ifdef DEBUG
	std::scoped_lock lock(logger_mutex);

	if (location == lease_ops)
		message = CYAN + message + RESET;

	std::cout << "[" + location_to_string(location) + "]\t" + message << std::endl;
#endif
}

void logger::warn(enum code_location location, std::string message)
{
	std::scoped_lock lock(logger_mutex);

	std::cerr << YELLOW "[" + location_to_string(location) + "]\t" RESET + message << std::endl;
}

logger global_logger;
