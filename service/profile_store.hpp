#ifndef _PROFILE_STORE_HPP_
#define _PROFILE_STORE_HPP_

#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "lease/lease_manager.hpp"
#include "store/remote_store.hpp"

/*
 * profile_store - Application handle on one remote store
 *
 * Carries the default payload every claimed or viewed profile is
 * reconciled against.
 */
class profile_store {
private:
	lease_manager &manager;
	remote_store &store;
	google::protobuf::Struct tmpl;

public:
	profile_store(lease_manager &mgr, remote_store &s, const google::protobuf::Struct &profile_template);
	~profile_store(void) = default;

	const std::string &get_name(void) const;
	const google::protobuf::Struct &get_template(void) const;

	std::shared_ptr<lease> claim(const std::string &key);
	std::shared_ptr<lease> force_load(const std::string &key, const cancel_token *cancel = nullptr);
	std::shared_ptr<lease> steal(const std::string &key);
	std::shared_ptr<lease> load(const std::string &key, const not_released_handler &handler);
	void release(const std::shared_ptr<lease> &l);

	/* Read-only copy with the payload reconciled against the template */
	std::optional<record> view(const std::string &key);
	void wipe(const std::string &key);
};

#endif /* _PROFILE_STORE_HPP_ */
