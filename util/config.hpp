#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <string>

#include <libconfig.h++>

#include "errors.hpp"

using namespace libconfig;

/*
 * settings - Tunables of the session lock machinery
 *
 * Durations are in seconds unless the name says otherwise.
 */
struct settings {
	/* Each active lease is saved about once per this many seconds */
	int auto_save_interval = 30;
	/* Minimum spacing between two writes to the same key */
	int write_cooldown = 7;
	/* Polling attempts before force_load steals unconditionally */
	int force_load_max_steps = 8;
	/* A foreign session not updated for this long is considered dead */
	int dead_lock_assumed_after = 30 * 60;
	int issue_count_for_critical_state = 5;
	int issue_window = 120;
	int critical_state_window = 120;

	int retry_attempts = 5;
	int retry_base_delay_ms = 500;
	int retry_max_delay_ms = 8000;

	int write_workers = 8;
	int dispatch_workers = 4;

	/* Throws invalid_configuration */
	void validate(void) const;
};

void read_config(Config &config, const char *path);

/* Reads every settings field present in 'config'; absent fields keep their defaults */
settings load_settings(const Config &config);

template <typename T>
T lookup_config(const Config &config, const char *field)
{
	try {
		return config.lookup(field);
	} catch (const SettingNotFoundException &e) {
		throw invalid_configuration("No \'" + std::string(field) + "\' setting in configuration file.");
	} catch (const SettingTypeException &e) {
		throw invalid_configuration("Setting \'" + std::string(field) + "\' has the wrong type.");
	}
}

#endif /* _CONFIG_HPP_ */
