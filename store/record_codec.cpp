#include "record_codec.hpp"

#include <cstring>

#include "util/errors.hpp"

std::string encode_record(const record &r)
{
	std::string body;

	if (!r.SerializeToString(&body))
		throw payload_too_large("encode_record() failed (record cannot be serialized)");

	return std::string(RECORD_MAGIC, RECORD_MAGIC_LEN) + body;
}

record decode_record(const std::string &bytes)
{
	record r;

	if (bytes.size() < RECORD_MAGIC_LEN || std::memcmp(bytes.data(), RECORD_MAGIC, RECORD_MAGIC_LEN) != 0)
		throw data_corruption("decode_record() failed (bad magic)");

	if (!r.ParseFromArray(bytes.data() + RECORD_MAGIC_LEN, static_cast<int>(bytes.size() - RECORD_MAGIC_LEN)))
		throw data_corruption("decode_record() failed (undecodable body)");

	return r;
}

void reconcile(google::protobuf::Struct &data, const google::protobuf::Struct &tmpl)
{
	auto *fields = data.mutable_fields();

	for (const auto &p : tmpl.fields()) {
		auto it = fields->find(p.first);
		if (it == fields->end()) {
			(*fields)[p.first] = p.second;
		} else if (it->second.kind_case() == google::protobuf::Value::kStructValue &&
			   p.second.kind_case() == google::protobuf::Value::kStructValue) {
			reconcile(*it->second.mutable_struct_value(), p.second.struct_value());
		}
	}
}

bool same_session(const session_id &a, const session_id &b)
{
	return a.process_id() == b.process_id() && a.job_id() == b.job_id();
}

std::string session_to_string(const session_id &s)
{
	return std::to_string(s.process_id()) + "/" + s.job_id();
}
