#include "config.hpp"

#include "lib/logger/logger.hpp"

void settings::validate(void) const
{
	auto positive = [](int value, const char *field) {
		if (value < 1)
			throw invalid_configuration("\'" + std::string(field) + "\' must be at least 1 (got " + std::to_string(value) + ")");
	};

	positive(auto_save_interval, "auto_save_interval");
	positive(force_load_max_steps, "force_load_max_steps");
	positive(dead_lock_assumed_after, "dead_lock_assumed_after");
	positive(issue_count_for_critical_state, "issue_count_for_critical_state");
	positive(issue_window, "issue_window");
	positive(critical_state_window, "critical_state_window");
	positive(retry_attempts, "retry_attempts");
	positive(write_workers, "write_workers");
	positive(dispatch_workers, "dispatch_workers");

	/* zero disables the spacing, which only the in-memory store tolerates */
	if (write_cooldown < 0)
		throw invalid_configuration("\'write_cooldown\' must not be negative");
	if (retry_base_delay_ms < 0 || retry_max_delay_ms < retry_base_delay_ms)
		throw invalid_configuration("\'retry_base_delay_ms\' must be within [0, retry_max_delay_ms]");
}

void read_config(Config &config, const char *path)
{
	try {
		config.readFile(path);
	} catch (const FileIOException &e) {
		throw invalid_configuration("I/O error while reading \'" + std::string(path) + "\'.");
	} catch (const ParseException &e) {
		throw invalid_configuration("Parse error at " + std::string(e.getFile() ? e.getFile() : path) + ":" + std::to_string(e.getLine()) + " - " + e.getError());
	}

	global_logger.log(config_ops, "Read configuration file " + std::string(path));
}

static void lookup_optional(const Config &config, const char *field, int &value)
{
	if (!config.exists(field))
		return;
	value = lookup_config<int>(config, field);
}

settings load_settings(const Config &config)
{
	settings s;

	lookup_optional(config, "auto_save_interval", s.auto_save_interval);
	lookup_optional(config, "write_cooldown", s.write_cooldown);
	lookup_optional(config, "force_load_max_steps", s.force_load_max_steps);
	lookup_optional(config, "dead_lock_assumed_after", s.dead_lock_assumed_after);
	lookup_optional(config, "issue_count_for_critical_state", s.issue_count_for_critical_state);
	lookup_optional(config, "issue_window", s.issue_window);
	lookup_optional(config, "critical_state_window", s.critical_state_window);
	lookup_optional(config, "retry_attempts", s.retry_attempts);
	lookup_optional(config, "retry_base_delay_ms", s.retry_base_delay_ms);
	lookup_optional(config, "retry_max_delay_ms", s.retry_max_delay_ms);
	lookup_optional(config, "write_workers", s.write_workers);
	lookup_optional(config, "dispatch_workers", s.dispatch_workers);

	s.validate();

	return s;
}
