#include <gtest/gtest.h>
#include <custody/blake3/hash.hpp>
#include <custody/execution/commitment.hpp>

#include <string_view>

TEST(blake3_hash, empty_input_matches_reference_digest) {
  auto digest = custody::blake3::hash(std::string_view{});
  EXPECT_EQ(custody::schema::to_hex(digest),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, string_and_byte_inputs_agree) {
  auto text = std::string_view{"open sesame"};
  EXPECT_EQ(custody::blake3::hash(text),
            custody::blake3::hash(custody::schema::make_bytes_view(text)));
  EXPECT_NE(custody::blake3::hash(text),
            custody::blake3::hash(std::string_view{"open sesame!"}));
}

TEST(commitment, commitment_is_the_digest_of_the_secret) {
  auto secret = std::string_view{"gift-secret"};
  auto commitment =
      custody::execution::make_commitment(custody::schema::make_bytes_view(secret));
  EXPECT_EQ(commitment,
            custody::schema::make_bytes(custody::blake3::hash(secret)));
}

TEST(commitment, comparison_requires_an_exact_match) {
  auto lhs = custody::schema::bytes_t(32, 0x11);
  auto rhs = lhs;
  EXPECT_TRUE(custody::execution::commitments_equal(lhs, rhs));

  rhs[31] = 0x12;
  EXPECT_FALSE(custody::execution::commitments_equal(lhs, rhs));

  rhs = custody::schema::bytes_t(31, 0x11);
  EXPECT_FALSE(custody::execution::commitments_equal(lhs, rhs));
}
