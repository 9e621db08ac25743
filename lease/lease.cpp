#include "lease.hpp"

#include "util/errors.hpp"

std::string lease_state_to_string(lease_state st)
{
	switch (st) {
	case lease_state::claiming:
		return "claiming";
	case lease_state::active:
		return "active";
	case lease_state::releasing:
		return "releasing";
	case lease_state::stolen:
		return "stolen";
	case lease_state::terminal:
		return "terminal";
	default:
		return "unknown";
	}
}

lease::lease(remote_store &s, const std::string &k, const record &loaded, const system_clock::time_point &now)
	: store(s), key(k), data(loaded.data()), metadata(loaded.metadata()), dirty(false),
	  load_count(loaded.metadata().session_load_count()), state(lease_state::claiming),
	  loaded_at(now), last_saved(now), save_in_flight(false)
{
}

remote_store &lease::get_store(void) const
{
	return store;
}

const std::string &lease::get_key(void) const
{
	return key;
}

google::protobuf::Struct lease::get_data(void) const
{
	std::scoped_lock lock(m);
	return data;
}

record_metadata lease::get_metadata(void) const
{
	std::scoped_lock lock(m);
	return metadata;
}

uint64_t lease::get_session_load_count(void) const
{
	std::scoped_lock lock(m);
	return load_count;
}

lease_state lease::get_state(void) const
{
	std::scoped_lock lock(m);
	return state;
}

bool lease::is_active(void) const
{
	return get_state() == lease_state::active;
}

bool lease::is_dirty(void) const
{
	std::scoped_lock lock(m);
	return dirty;
}

system_clock::time_point lease::get_loaded_at(void) const
{
	std::scoped_lock lock(m);
	return loaded_at;
}

system_clock::time_point lease::get_last_saved(void) const
{
	std::scoped_lock lock(m);
	return last_saved;
}

void lease::update(const std::function<void(google::protobuf::Struct &)> &fn)
{
	std::scoped_lock lock(m);

	if (state != lease_state::active)
		throw lease_stolen("lease::update() failed (" + store.get_name() + "/" + key + " is " + lease_state_to_string(state) + ")");

	fn(data);
	dirty = true;
}

void lease::set_meta_tag(const std::string &name, const google::protobuf::Value &value)
{
	std::scoped_lock lock(m);

	if (state != lease_state::active)
		throw lease_stolen("lease::set_meta_tag() failed (" + store.get_name() + "/" + key + " is " + lease_state_to_string(state) + ")");

	(*metadata.mutable_meta_tags()->mutable_fields())[name] = value;
	dirty = true;
}

record lease::take_snapshot(void)
{
	std::scoped_lock lock(m);

	record r;
	*r.mutable_data() = data;
	*r.mutable_metadata()->mutable_meta_tags() = metadata.meta_tags();
	dirty = false;

	return r;
}

void lease::restore_dirty(void)
{
	std::scoped_lock lock(m);
	dirty = true;
}

void lease::saved(const record_metadata &latest, const system_clock::time_point &now)
{
	std::scoped_lock lock(m);

	/* meta tags set locally after the snapshot must survive */
	auto tags = metadata.meta_tags();
	metadata = latest;
	*metadata.mutable_meta_tags() = tags;
	last_saved = now;
}

bool lease::transition(lease_state from, lease_state to)
{
	std::scoped_lock lock(m);

	if (state != from)
		return false;
	state = to;

	return true;
}

void lease::set_state(lease_state to)
{
	std::scoped_lock lock(m);
	state = to;
}

bool lease::begin_save(void)
{
	bool expected = false;
	return save_in_flight.compare_exchange_strong(expected, true);
}

void lease::end_save(void)
{
	save_in_flight = false;
}
