#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <libconfig.h++>

#include <grpcpp/grpcpp.h>

using grpc::Server;
using grpc::ServerBuilder;

#include "admin_impl.hpp"
#include "lib/logger/logger.hpp"
#include "lib/rados_io/rados_io.hpp"
#include "service/profile_service.hpp"
#include "util/config.hpp"

using namespace libconfig;

static std::string lookup_or(const Config &config, const char *field, const std::string &fallback)
{
	std::string value;
	return config.lookupValue(field, value) ? value : fallback;
}

int main(int argc, char *argv[])
{
	if (argc < 2) {
		std::cerr << "Usage: " << argv[0] << " <config_path>" << std::endl;
		return 1;
	}

	/* SIGINT and SIGTERM are taken by the waiter thread below, not by any worker */
	sigset_t stop_signals;
	sigemptyset(&stop_signals);
	sigaddset(&stop_signals, SIGINT);
	sigaddset(&stop_signals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

	/* Get configuration */

	Config cfg;
	settings conf;
	std::string manager_ip, manager_port, pool_name;
	long long process_id;

	try {
		read_config(cfg, argv[1]);
		conf = load_settings(cfg);
		manager_ip = lookup_config<std::string>(cfg, "manager_ip");
		manager_port = lookup_config<std::string>(cfg, "manager_port");
		pool_name = lookup_config<std::string>(cfg, "pool_name");
		process_id = lookup_config<long long>(cfg, "process_id");
	} catch (const invalid_configuration &e) {
		std::cerr << e.what() << std::endl;
		exit(1);
	}

	/* Launch service */

	rados_io::conn_info ci = {
		lookup_or(cfg, "ceph_user", "client.admin"),
		lookup_or(cfg, "ceph_cluster", "ceph"),
		lookup_or(cfg, "ceph_conf", "/etc/ceph/ceph.conf"),
		0
	};
	std::shared_ptr<rados_io> store;
	try {
		store = std::make_shared<rados_io>(ci, pool_name);
	} catch (const std::runtime_error &e) {
		std::cerr << e.what() << std::endl;
		exit(1);
	}

	auto clock = std::make_shared<real_clock>();
	profile_service service(conf, profile_service::make_session(process_id), clock);

	service.get_gateway().corruption.connect([](std::string store_name, std::string key) {
		global_logger.warn(manager_admin, "Record " + store_name + "/" + key + " needs repair");
	});
	service.get_manager().lease_lost.connect([](std::shared_ptr<lease> l) {
		global_logger.warn(manager_admin, "Lease on " + l->get_key() + " was taken by another process");
	});

	std::string server_address(manager_ip + ":" + manager_port);
	admin_impl admin_service(service, *store, clock, conf.dead_lock_assumed_after);

	ServerBuilder builder;
	builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
	builder.RegisterService(&admin_service);
	std::unique_ptr<Server> server(builder.BuildAndStart());
	if (!server) {
		std::cerr << "Failed to listen on " << server_address << std::endl;
		return 1;
	}
	global_logger.log(manager_admin, "Listening on " + server_address);

	std::thread waiter([&stop_signals, &server] {
		int sig;
		sigwait(&stop_signals, &sig);
		global_logger.warn(manager_admin, "Caught signal " + std::to_string(sig) + ", shutting down");
		server->Shutdown();
	});

	server->Wait();
	waiter.join();

	/* Releases every lease this daemon still holds */
	service.shutdown();

	return 0;
}
