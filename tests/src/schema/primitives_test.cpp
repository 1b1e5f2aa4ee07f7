#include <gtest/gtest.h>
#include <custody/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_copies_all_bytes) {
  auto input = custody::schema::bytes_t(32, 0xAB);
  auto hash = custody::schema::make_hash32(input);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_decodes_prefixed_hex) {
  auto hash = custody::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  auto short_bytes = custody::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(custody::schema::try_make_hash32(
                   custody::schema::bytes_view_t{short_bytes})
                   .has_value());
  EXPECT_FALSE(
      custody::schema::try_make_hash32(std::string_view{"abcd"}).has_value());
  EXPECT_FALSE(
      custody::schema::try_make_hash32(std::string_view{"ledger-name"})
          .has_value());
}

TEST(primitives, hex_encodes_lowercase_and_decodes_either_case) {
  auto bytes = custody::schema::bytes_t{0x00, 0x7F, 0xA5, 0xFF};
  EXPECT_EQ(custody::schema::to_hex(custody::schema::bytes_view_t{bytes}),
            "007fa5ff");

  auto decoded = custody::schema::try_from_hex("007FA5ff");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);
}

TEST(primitives, try_from_hex_rejects_malformed_input) {
  EXPECT_FALSE(custody::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(custody::schema::try_from_hex("zz").has_value());
  auto empty = custody::schema::try_from_hex("0x");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(primitives, zero_hash_is_the_null_principal) {
  EXPECT_TRUE(custody::schema::is_null(custody::schema::make_zero_hash()));

  auto principal = custody::schema::make_zero_hash();
  principal[31] = 1;
  EXPECT_FALSE(custody::schema::is_null(principal));
}

TEST(primitives, string_and_bytes_conversions_preserve_content) {
  auto text = std::string{"SN-0001"};
  auto bytes = custody::schema::make_bytes(text);
  EXPECT_EQ(bytes.size(), text.size());
  EXPECT_EQ(custody::schema::make_string(bytes), text);
  EXPECT_EQ(custody::schema::make_string_view(bytes), text);

  auto hash = custody::schema::make_zero_hash();
  hash[0] = 0x42;
  auto hash_bytes = custody::schema::make_bytes(hash);
  ASSERT_EQ(hash_bytes.size(), 32u);
  EXPECT_EQ(hash_bytes[0], 0x42);
}
