#include "profile_store.hpp"

#include "store/record_codec.hpp"

profile_store::profile_store(lease_manager &mgr, remote_store &s, const google::protobuf::Struct &profile_template)
	: manager(mgr), store(s), tmpl(profile_template)
{
}

const std::string &profile_store::get_name(void) const
{
	return store.get_name();
}

const google::protobuf::Struct &profile_store::get_template(void) const
{
	return tmpl;
}

std::shared_ptr<lease> profile_store::claim(const std::string &key)
{
	return manager.claim(store, key, tmpl);
}

std::shared_ptr<lease> profile_store::force_load(const std::string &key, const cancel_token *cancel)
{
	return manager.force_load(store, key, tmpl, cancel);
}

std::shared_ptr<lease> profile_store::steal(const std::string &key)
{
	return manager.steal(store, key, tmpl);
}

std::shared_ptr<lease> profile_store::load(const std::string &key, const not_released_handler &handler)
{
	return manager.load(store, key, tmpl, handler);
}

void profile_store::release(const std::shared_ptr<lease> &l)
{
	manager.release(l);
}

std::optional<record> profile_store::view(const std::string &key)
{
	auto r = manager.view(store, key);
	if (r)
		reconcile(*r->mutable_data(), tmpl);

	return r;
}

void profile_store::wipe(const std::string &key)
{
	manager.wipe(store, key);
}
