#include "admin_impl.hpp"

#include <google/protobuf/struct.pb.h>

#include "lib/logger/logger.hpp"
#include "store/record_codec.hpp"
#include "util/errors.hpp"

admin_impl::admin_impl(profile_service &svc, remote_store &s, std::shared_ptr<clock_source> clock, int64_t dead_lock_seconds)
	: service(svc), store(s), clk(clock), dead_lock_assumed_after(dead_lock_seconds)
{
}

Status admin_impl::inspect(ServerContext *context, const key_request *request, inspect_response *response)
{
	global_logger.log(manager_admin, "Called inspect(" + request->key() + ")");

	std::optional<record> r;
	try {
		r = service.get_manager().view(store, request->key());
	} catch (const data_corruption &e) {
		response->set_ret(-2);
		return Status::OK;
	} catch (const store_error &e) {
		return Status(grpc::StatusCode::UNAVAILABLE, e.what());
	} catch (const service_stopping &e) {
		return Status(grpc::StatusCode::UNAVAILABLE, e.what());
	}

	if (!r) {
		response->set_ret(-1);
		return Status::OK;
	}

	const auto &md = r->metadata();
	bool stale = clk->unix_seconds() - md.last_update() > dead_lock_assumed_after;

	response->set_ret(0);
	*response->mutable_metadata() = md;
	response->set_locked(md.has_active_session() && !stale);
	response->set_stale(md.has_active_session() && stale);

	return Status::OK;
}

Status admin_impl::health(ServerContext *context, const empty *dummy_in, health_response *response)
{
	response->set_critical(service.get_health().is_critical());
	response->set_recent_issues(service.get_health().get_issue_count());
	response->set_active_leases(service.get_manager().get_active_count());
	response->set_write_queues(service.get_channel().queue_count());

	return Status::OK;
}

Status admin_impl::takeover(ServerContext *context, const key_request *request, takeover_response *response)
{
	global_logger.log(manager_admin, "Called takeover(" + request->key() + ")");

	auto &manager = service.get_manager();
	google::protobuf::Struct no_defaults;

	try {
		auto before = manager.view(store, request->key());
		if (!before) {
			response->set_ret(-1);
			return Status::OK;
		}
		if (before->metadata().has_active_session())
			*response->mutable_previous_holder() = before->metadata().active_session();

		auto l = manager.force_load(store, request->key(), no_defaults);
		manager.release(l);
		response->set_ret(0);

		global_logger.warn(manager_admin, "Took over " + store.get_name() + "/" + request->key());
	} catch (const force_load_interrupted &e) {
		response->set_ret(-3);
		response->mutable_previous_holder()->set_process_id(e.holder_process_id);
		response->mutable_previous_holder()->set_job_id(e.holder_job_id);
	} catch (const already_loaded &e) {
		return Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
	} catch (const service_stopping &e) {
		return Status(grpc::StatusCode::UNAVAILABLE, e.what());
	} catch (const store_error &e) {
		response->set_ret(-2);
	}

	return Status::OK;
}
