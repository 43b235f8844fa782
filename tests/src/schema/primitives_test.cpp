#include <gtest/gtest.h>
#include <tollgate/schema/primitives.hpp>

TEST(primitives, to_hex_encodes_lowercase) {
  auto bytes = tollgate::schema::bytes_t{0x00, 0x0A, 0xFF, 0x10};
  EXPECT_EQ(tollgate::schema::to_hex(tollgate::schema::bytes_view_t{bytes}),
            "000aff10");
}

TEST(primitives, to_hex_of_hash_has_64_digits) {
  auto hash = tollgate::schema::hash32_t{};
  hash[0] = 0xAB;
  hash[31] = 0x01;
  auto hex = tollgate::schema::to_hex(hash);
  EXPECT_EQ(hex.size(), 64u);
  EXPECT_EQ(hex.substr(0, 2), "ab");
  EXPECT_EQ(hex.substr(62), "01");
}

TEST(primitives, string_and_byte_views_share_contents) {
  auto text = std::string{"crm.update"};
  auto bytes = tollgate::schema::make_bytes(text);
  EXPECT_EQ(bytes.size(), text.size());
  EXPECT_EQ(tollgate::schema::make_string(bytes), text);
  EXPECT_EQ(tollgate::schema::make_string_view(bytes), std::string_view{text});
  EXPECT_EQ(tollgate::schema::make_bytes(tollgate::schema::bytes_view_t{bytes}),
            bytes);
}
