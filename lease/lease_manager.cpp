#include "lease_manager.hpp"

#include <future>
#include <vector>

#include "lib/logger/logger.hpp"
#include "store/record_codec.hpp"
#include "util/errors.hpp"

lease_manager::lease_manager(record_gateway &gw, write_channel &ch, task_pool &dispatch_pool, std::shared_ptr<clock_source> clock,
			     const settings &s, const session_id &self_session)
	: gateway(gw), channel(ch), dispatch(dispatch_pool), clk(clock), conf(s), self(self_session),
	  auto_save(clock, std::chrono::seconds(s.auto_save_interval), std::chrono::seconds(s.dead_lock_assumed_after), dispatch_pool,
		    [this](std::shared_ptr<lease> l) { save(l); }),
	  stopping(false), claims_in_flight(0)
{
}

lease_manager::claim_scope::claim_scope(lease_manager &manager, remote_store &store, const std::string &key) : mgr(manager)
{
	std::scoped_lock lock(mgr.claims_m);

	if (mgr.stopping)
		throw service_stopping("lease_manager: shutting down, refusing to claim " + store.get_name() + "/" + key);

	mgr.claims_in_flight++;
}

lease_manager::claim_scope::~claim_scope(void)
{
	std::scoped_lock lock(mgr.claims_m);

	if (--mgr.claims_in_flight == 0)
		mgr.claims_cv.notify_all();
}

const session_id &lease_manager::get_self(void) const
{
	return self;
}

void lease_manager::reserve(remote_store &store, const std::string &key)
{
	if (table.reserve(store.get_name(), key) != 0)
		throw already_loaded(store.get_name() + "/" + key + " is already held or being claimed by this process");
}

lease_manager::claim_outcome lease_manager::try_claim(remote_store &store, const std::string &key,
						     const google::protobuf::Struct &tmpl, claim_mode mode)
{
	int64_t now = clk->unix_seconds();
	int64_t dead_after = conf.dead_lock_assumed_after;
	const session_id me = self;

	auto latest = gateway.persist(store, key, [&](const std::optional<record> &current) -> std::optional<record> {
		record r;
		if (current) {
			r = *current;
		} else {
			*r.mutable_data() = tmpl;
			r.mutable_metadata()->set_profile_create_time(now);
		}

		auto *md = r.mutable_metadata();
		bool take;

		if (!md->has_active_session() || same_session(md->active_session(), me)) {
			take = true;
		} else if (now - md->last_update() > dead_after) {
			take = true;
		} else if (mode == claim_mode::steal) {
			take = true;
		} else if (mode == claim_mode::steal_if_requested) {
			take = md->has_force_load_session() && same_session(md->force_load_session(), me);
		} else if (mode == claim_mode::request_force_load) {
			*md->mutable_force_load_session() = me;
			return r;
		} else {
			take = false;
		}

		if (!take)
			return std::nullopt;

		*md->mutable_active_session() = me;
		md->clear_force_load_session();
		md->set_session_load_count(md->session_load_count() + 1);
		md->set_last_update(now);

		return r;
	});

	if (!latest)
		throw store_unavailable("lease_manager: " + store.get_name() + "/" + key + " vanished while claiming");

	claim_outcome out;
	out.latest = *latest;

	const auto &md = latest->metadata();
	if (!md.has_active_session() || !same_session(md.active_session(), me))
		return out;

	record loaded = *latest;
	reconcile(*loaded.mutable_data(), tmpl);

	auto l = std::make_shared<lease>(store, key, loaded, clk->now());
	l->transition(lease_state::claiming, lease_state::active);
	table.fill(store.get_name(), key, l);
	auto_save.add(l);

	global_logger.log(lease_ops, "Claimed " + store.get_name() + "/" + key + " (session_load_count: " +
			  std::to_string(md.session_load_count()) + ")");

	if (stopping) {
		global_logger.warn(lease_ops, "Shutting down, giving " + store.get_name() + "/" + key + " back right after the claim");
		release(l);
		throw service_stopping("lease_manager: shut down while claiming " + store.get_name() + "/" + key);
	}

	out.l = l;
	return out;
}

std::shared_ptr<lease> lease_manager::claim(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl)
{
	global_logger.log(lease_ops, "Called claim(" + store.get_name() + ", " + key + ")");
	claim_scope scope(*this, store, key);
	reserve(store, key);

	try {
		auto out = try_claim(store, key, tmpl, claim_mode::plain);
		if (out.l)
			return out.l;

		const auto &holder = out.latest.metadata().active_session();
		throw session_locked(store.get_name() + "/" + key + " is locked by session " + session_to_string(holder),
				     holder.process_id(), holder.job_id());
	} catch (...) {
		table.erase(store.get_name(), key, nullptr);
		throw;
	}
}

void lease_manager::withdraw_force_load(remote_store &store, const std::string &key)
{
	const session_id me = self;

	gateway.persist(store, key, [&me](const std::optional<record> &current) -> std::optional<record> {
		if (!current || !current->metadata().has_force_load_session() ||
		    !same_session(current->metadata().force_load_session(), me))
			return std::nullopt;

		record r = *current;
		r.mutable_metadata()->clear_force_load_session();
		return r;
	});
}

std::shared_ptr<lease> lease_manager::force_load(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl,
						 const cancel_token *cancel)
{
	global_logger.log(lease_ops, "Called force_load(" + store.get_name() + ", " + key + ")");
	claim_scope scope(*this, store, key);
	reserve(store, key);

	try {
		claim_mode mode = claim_mode::request_force_load;
		int step = 0;

		while (true) {
			if (step > 0 && cancel && cancel->is_cancelled()) {
				global_logger.log(lease_ops, "force_load(" + store.get_name() + ", " + key + ") cancelled at step " + std::to_string(step));
				withdraw_force_load(store, key);
				table.erase(store.get_name(), key, nullptr);
				return nullptr;
			}

			if (step > 0 && stopping) {
				global_logger.log(lease_ops, "force_load(" + store.get_name() + ", " + key + ") stopped at step " + std::to_string(step));
				withdraw_force_load(store, key);
				throw service_stopping("lease_manager: shut down while force loading " + store.get_name() + "/" + key);
			}

			auto out = try_claim(store, key, tmpl, mode);
			if (out.l) {
				global_logger.log(lease_ops, "force_load(" + store.get_name() + ", " + key + ") succeeded at step " + std::to_string(step));
				return out.l;
			}

			const auto &md = out.latest.metadata();
			if (!md.has_force_load_session() || !same_session(md.force_load_session(), self)) {
				const auto &other = md.has_force_load_session() ? md.force_load_session() : md.active_session();
				throw force_load_interrupted(store.get_name() + "/" + key + " force load interrupted by session " + session_to_string(other),
							     other.process_id(), other.job_id());
			}

			step++;
			mode = step >= conf.force_load_max_steps ? claim_mode::steal_if_requested : claim_mode::plain;
			if (mode == claim_mode::steal_if_requested)
				global_logger.warn(lease_ops, "Taking " + store.get_name() + "/" + key + " from unresponsive session " +
						   session_to_string(md.active_session()));

			clk->sleep_for(std::chrono::seconds(1));
		}
	} catch (...) {
		table.erase(store.get_name(), key, nullptr);
		throw;
	}
}

std::shared_ptr<lease> lease_manager::steal(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl)
{
	global_logger.log(lease_ops, "Called steal(" + store.get_name() + ", " + key + ")");
	claim_scope scope(*this, store, key);
	reserve(store, key);

	try {
		auto out = try_claim(store, key, tmpl, claim_mode::steal);
		if (!out.l)
			throw store_unavailable("lease_manager: steal of " + store.get_name() + "/" + key + " was not applied");
		return out.l;
	} catch (...) {
		table.erase(store.get_name(), key, nullptr);
		throw;
	}
}

std::shared_ptr<lease> lease_manager::load(remote_store &store, const std::string &key, const google::protobuf::Struct &tmpl,
					   const not_released_handler &handler)
{
	while (true) {
		session_id holder;

		try {
			return claim(store, key, tmpl);
		} catch (const session_locked &e) {
			holder.set_process_id(e.holder_process_id);
			holder.set_job_id(e.holder_job_id);
		}

		switch (handler(holder)) {
		case not_released_action::repeat:
			clk->sleep_for(std::chrono::seconds(1));
			break;
		case not_released_action::cancel:
			return nullptr;
		case not_released_action::force_load:
			return force_load(store, key, tmpl);
		case not_released_action::steal:
			return steal(store, key, tmpl);
		}
	}
}

void lease_manager::save_internal(const std::shared_ptr<lease> &l, bool release)
{
	remote_store &store = l->get_store();
	const std::string &key = l->get_key();

	record snapshot = l->take_snapshot();
	uint64_t expected = l->get_session_load_count();
	int64_t now = clk->unix_seconds();
	const session_id me = self;

	std::optional<record> latest;

	try {
		latest = gateway.persist(store, key, [&](const std::optional<record> &current) -> std::optional<record> {
			if (!current)
				return std::nullopt;

			const auto &md = current->metadata();
			if (!md.has_active_session() || !same_session(md.active_session(), me) || md.session_load_count() != expected)
				return std::nullopt;

			bool force_pending = md.has_force_load_session() && !same_session(md.force_load_session(), me);

			record r = *current;
			*r.mutable_data() = snapshot.data();
			*r.mutable_metadata()->mutable_meta_tags() = snapshot.metadata().meta_tags();
			r.mutable_metadata()->set_last_update(now);

			if (release) {
				r.mutable_metadata()->clear_active_session();
				r.mutable_metadata()->clear_force_load_session();
			} else if (force_pending) {
				/* hand the record over to the session waiting for it */
				r.mutable_metadata()->clear_active_session();
			}

			return r;
		});
	} catch (const std::exception &e) {
		l->restore_dirty();
		if (release)
			throw;
		global_logger.warn(lease_ops, "Save of " + store.get_name() + "/" + key + " failed, lease kept: " + e.what());
		return;
	}

	if (release)
		return;

	if (latest) {
		const auto &md = latest->metadata();
		if (md.has_active_session() && same_session(md.active_session(), me) && md.session_load_count() == expected) {
			l->saved(md, clk->now());
			global_logger.log(lease_ops, "Saved " + store.get_name() + "/" + key);
			return;
		}
	}

	lose(l, latest);
}

void lease_manager::lose(const std::shared_ptr<lease> &l, const std::optional<record> &latest)
{
	if (!l->transition(lease_state::active, lease_state::stolen))
		return;

	std::string by = "record removed";
	if (latest) {
		const auto &md = latest->metadata();
		by = md.has_active_session() ? "session " + session_to_string(md.active_session()) : "handed over to a force load";
	}
	global_logger.warn(lease_ops, "Lost " + l->get_store().get_name() + "/" + l->get_key() + " (" + by + ")");

	auto_save.remove(l);
	table.erase(l->get_store().get_name(), l->get_key(), l);

	lease_lost.fire(l);
	l->released.fire();
}

void lease_manager::save(const std::shared_ptr<lease> &l)
{
	if (!l->is_active())
		return;

	save_internal(l, false);
}

void lease_manager::release(const std::shared_ptr<lease> &l)
{
	remote_store &store = l->get_store();
	const std::string &key = l->get_key();

	global_logger.log(lease_ops, "Called release(" + store.get_name() + ", " + key + ")");

	if (!l->transition(lease_state::active, lease_state::releasing))
		return;

	auto_save.remove(l);

	std::exception_ptr failure;
	try {
		save_internal(l, true);
	} catch (const std::exception &e) {
		global_logger.warn(lease_ops, "Final save of " + store.get_name() + "/" + key + " failed: " + e.what());
		failure = std::current_exception();
	}

	channel.drain(store.get_name(), key);

	l->set_state(lease_state::terminal);
	table.erase(store.get_name(), key, l);
	l->released.fire();

	if (failure)
		std::rethrow_exception(failure);
}

std::optional<record> lease_manager::view(remote_store &store, const std::string &key)
{
	return gateway.fetch(store, key);
}

void lease_manager::wipe(remote_store &store, const std::string &key)
{
	global_logger.log(lease_ops, "Called wipe(" + store.get_name() + ", " + key + ")");
	gateway.remove(store, key);
}

void lease_manager::shutdown(void)
{
	{
		std::unique_lock lock(claims_m);

		if (stopping.exchange(true))
			return;

		if (claims_in_flight > 0)
			global_logger.log(lease_ops, "Shutting down, waiting for " + std::to_string(claims_in_flight) + " claims in flight");
		claims_cv.wait(lock, [this] { return claims_in_flight == 0; });
	}

	auto leases = table.get_leases();
	global_logger.log(lease_ops, "Shutting down, releasing " + std::to_string(leases.size()) + " leases");

	std::vector<std::future<void>> pending;
	for (const auto &l : leases) {
		auto done = std::make_shared<std::promise<void>>();
		pending.push_back(done->get_future());
		dispatch.spawn([this, l, done] {
			try {
				release(l);
				done->set_value();
			} catch (...) {
				done->set_exception(std::current_exception());
			}
		});
	}

	for (auto &f : pending) {
		try {
			f.get();
		} catch (const std::exception &e) {
			global_logger.warn(lease_ops, std::string("Release during shutdown failed: ") + e.what());
		}
	}
}

void lease_manager::tick(void)
{
	auto_save.tick();
}

size_t lease_manager::get_active_count(void)
{
	return auto_save.size();
}

std::shared_ptr<lease> lease_manager::find(remote_store &store, const std::string &key)
{
	return table.find(store.get_name(), key);
}

lease_guard::lease_guard(lease_manager &mgr, std::shared_ptr<lease> held) : manager(mgr), l(std::move(held))
{
}

lease_guard::~lease_guard(void)
{
	if (!l)
		return;

	try {
		manager.release(l);
	} catch (const std::exception &e) {
		global_logger.warn(lease_ops, "Release of " + l->get_key() + " on scope exit failed: " + e.what());
	}
}

const std::shared_ptr<lease> &lease_guard::get(void) const
{
	return l;
}

lease *lease_guard::operator->(void) const
{
	return l.get();
}
