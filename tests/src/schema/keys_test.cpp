#include <gtest/gtest.h>
#include <tollgate/schema/key/keys.hpp>

#include <algorithm>
#include <vector>

namespace key = tollgate::schema::key;

TEST(keys, prefixed_keys_join_prefix_and_id) {
  EXPECT_EQ(tollgate::schema::make_string(key::make_approval_key("a7")),
            "APPROVAL|a7");
  EXPECT_EQ(tollgate::schema::make_string(key::make_execution_key("exec-1")),
            "EXECUTION|exec-1");
  EXPECT_EQ(tollgate::schema::make_string(key::make_sequence_key(
                key::kAuditSequenceName)),
            "SYS|SEQ|AUDIT");
}

TEST(keys, sequence_encoding_is_big_endian) {
  auto encoded = key::encode_sequence(0x0102030405060708ull);
  ASSERT_EQ(encoded.size(), 8u);
  EXPECT_EQ(encoded.front(), 0x01);
  EXPECT_EQ(encoded.back(), 0x08);
  EXPECT_EQ(key::decode_sequence(tollgate::schema::bytes_view_t{encoded}),
            0x0102030405060708ull);
}

TEST(keys, audit_keys_sort_in_append_order) {
  auto keys = std::vector<tollgate::schema::bytes_t>{
      key::make_audit_key("exec-1", 256), key::make_audit_key("exec-1", 2),
      key::make_audit_key("exec-1", 17)};
  std::sort(std::begin(keys), std::end(keys));
  EXPECT_EQ(keys[0], key::make_audit_key("exec-1", 2));
  EXPECT_EQ(keys[1], key::make_audit_key("exec-1", 17));
  EXPECT_EQ(keys[2], key::make_audit_key("exec-1", 256));
}

TEST(keys, audit_prefix_does_not_cover_other_executions) {
  auto prefix = key::make_audit_prefix("exec-1");
  auto own = key::make_audit_key("exec-1", 1);
  auto other = key::make_audit_key("exec-10", 1);
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix), std::begin(own)));
  EXPECT_FALSE(
      std::equal(std::begin(prefix), std::end(prefix), std::begin(other)));
}
