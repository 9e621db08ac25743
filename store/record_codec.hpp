#ifndef _RECORD_CODEC_HPP_
#define _RECORD_CODEC_HPP_

#include <string>

#include <google/protobuf/struct.pb.h>

#include "record.pb.h"

#define RECORD_MAGIC "PRF1"
#define RECORD_MAGIC_LEN 4

/* Throws payload_too_large if the record cannot be serialized */
std::string encode_record(const record &r);

/* Throws data_corruption if 'bytes' is not an encoded record */
record decode_record(const std::string &bytes);

/*
 * reconcile() - Fill fields of 'data' missing from 'tmpl'
 *
 * Nested structs are reconciled recursively. Fields already present in
 * 'data' are never overwritten, even when their kind differs.
 */
void reconcile(google::protobuf::Struct &data, const google::protobuf::Struct &tmpl);

bool same_session(const session_id &a, const session_id &b);
std::string session_to_string(const session_id &s);

#endif /* _RECORD_CODEC_HPP_ */
