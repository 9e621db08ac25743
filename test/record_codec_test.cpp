#include <string>

#include <gtest/gtest.h>

#include "store/record_codec.hpp"
#include "test_util.hpp"
#include "util/errors.hpp"

TEST(record_codec, keeps_payload_and_metadata)
{
	record r;
	*r.mutable_data() = default_template();
	auto *md = r.mutable_metadata();
	*md->mutable_active_session() = make_session_id(12, "job-a");
	md->set_session_load_count(3);
	md->set_profile_create_time(1577836800);
	md->set_last_update(1577836900);
	(*md->mutable_meta_tags()->mutable_fields())["region"] = string_value("eu");

	std::string bytes = encode_record(r);
	EXPECT_EQ(bytes.compare(0, RECORD_MAGIC_LEN, RECORD_MAGIC), 0);

	record back = decode_record(bytes);
	EXPECT_TRUE(same_session(back.metadata().active_session(), make_session_id(12, "job-a")));
	EXPECT_FALSE(back.metadata().has_force_load_session());
	EXPECT_EQ(back.metadata().session_load_count(), 3u);
	EXPECT_EQ(back.metadata().last_update(), 1577836900);
	EXPECT_EQ(back.metadata().meta_tags().fields().at("region").string_value(), "eu");
	EXPECT_EQ(get_number(back.data(), "coins"), 0);
}

TEST(record_codec, rejects_foreign_bytes)
{
	EXPECT_THROW(decode_record(""), data_corruption);
	EXPECT_THROW(decode_record("PRF"), data_corruption);
	EXPECT_THROW(decode_record("{\"coins\": 3}"), data_corruption);
}

TEST(record_codec, rejects_truncated_body)
{
	std::string bytes = std::string(RECORD_MAGIC, RECORD_MAGIC_LEN) + std::string("\x0a\x05" "ab", 4);

	EXPECT_THROW(decode_record(bytes), data_corruption);
}

TEST(record_codec, reconcile_fills_missing_fields_only)
{
	google::protobuf::Struct data;
	(*data.mutable_fields())["coins"] = number_value(5);

	google::protobuf::Struct tmpl = default_template();
	(*tmpl.mutable_fields())["gems"] = number_value(1);

	reconcile(data, tmpl);

	EXPECT_EQ(get_number(data, "coins"), 5);
	EXPECT_EQ(get_number(data, "gems"), 1);
	ASSERT_EQ(data.fields().count("inventory"), 1u);
	EXPECT_EQ(get_number(data.fields().at("inventory").struct_value(), "slots"), 10);
}

TEST(record_codec, reconcile_descends_into_nested_structs)
{
	google::protobuf::Struct inventory;
	(*inventory.mutable_fields())["slots"] = number_value(3);

	google::protobuf::Struct data;
	*(*data.mutable_fields())["inventory"].mutable_struct_value() = inventory;

	google::protobuf::Struct tmpl = default_template();
	(*(*tmpl.mutable_fields())["inventory"].mutable_struct_value()->mutable_fields())["capacity"] = number_value(50);

	reconcile(data, tmpl);

	const auto &got = data.fields().at("inventory").struct_value();
	EXPECT_EQ(get_number(got, "slots"), 3);
	EXPECT_EQ(get_number(got, "capacity"), 50);
	EXPECT_EQ(get_number(data, "coins"), 0);
}

TEST(record_codec, reconcile_keeps_fields_of_another_kind)
{
	google::protobuf::Struct data;
	(*data.mutable_fields())["inventory"] = string_value("legacy");

	reconcile(data, default_template());

	EXPECT_EQ(data.fields().at("inventory").string_value(), "legacy");
}

TEST(record_codec, sessions_compare_by_process_and_job)
{
	EXPECT_TRUE(same_session(make_session_id(1, "a"), make_session_id(1, "a")));
	EXPECT_FALSE(same_session(make_session_id(1, "a"), make_session_id(1, "b")));
	EXPECT_FALSE(same_session(make_session_id(1, "a"), make_session_id(2, "a")));
	EXPECT_EQ(session_to_string(make_session_id(7, "job-7")), "7/job-7");
}
