#ifndef _ADMIN_IMPL_HPP_
#define _ADMIN_IMPL_HPP_

#include <grpcpp/grpcpp.h>

using grpc::ServerContext;
using grpc::Status;

#include "admin.pb.h"
#include "admin.grpc.pb.h"

#include "service/profile_service.hpp"
#include "store/remote_store.hpp"

class admin_impl final : public profile_admin::Service {
private:
	profile_service &service;
	remote_store &store;
	std::shared_ptr<clock_source> clk;
	int64_t dead_lock_assumed_after;

	Status inspect(ServerContext *context, const key_request *request, inspect_response *response) override;
	Status health(ServerContext *context, const empty *dummy_in, health_response *response) override;

	/*
	 * takeover() - Free a key whose holder is unreachable
	 *
	 * Force loads the key with this daemon's session, then releases it
	 * at once so any process can claim it. A missing record is left
	 * missing.
	 */
	Status takeover(ServerContext *context, const key_request *request, takeover_response *response) override;

public:
	admin_impl(profile_service &svc, remote_store &s, std::shared_ptr<clock_source> clock, int64_t dead_lock_seconds);
	~admin_impl(void) = default;
};

#endif /* _ADMIN_IMPL_HPP_ */
