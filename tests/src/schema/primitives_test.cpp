#include <gtest/gtest.h>
#include <bazaar/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = bazaar::schema::bytes_t(32, 0xAB);
  auto hash = bazaar::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_accepts_prefixed_hex) {
  auto hash = bazaar::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(bazaar::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(bazaar::schema::try_make_hash32("zz").has_value());
}

TEST(primitives, hex_decoding_rejects_odd_and_non_hex_input) {
  EXPECT_FALSE(bazaar::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(bazaar::schema::try_from_hex("0g").has_value());
  auto decoded = bazaar::schema::try_from_hex("00FFa0");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, (bazaar::schema::bytes_t{0x00, 0xFF, 0xA0}));
}

TEST(primitives, to_hex_is_lowercase) {
  auto bytes = bazaar::schema::bytes_t{0xDE, 0xAD, 0x01};
  EXPECT_EQ(bazaar::schema::to_hex(bazaar::schema::bytes_view_t{bytes}),
            "dead01");
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = bazaar::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, signer_strings_carry_their_scheme) {
  auto named = bazaar::schema::named_signer_t{};
  named[0] = 0x7F;
  auto ed = bazaar::schema::ed25519_signer_id{};
  ed.public_key[31] = 0x01;

  auto named_text =
      bazaar::schema::to_string(bazaar::schema::signer_id_t{named});
  auto ed_text = bazaar::schema::to_string(bazaar::schema::signer_id_t{ed});
  EXPECT_TRUE(named_text.starts_with("named:7f"));
  EXPECT_TRUE(ed_text.starts_with("ed25519:00"));
  EXPECT_TRUE(ed_text.ends_with("01"));
}

TEST(primitives, principals_compare_by_scheme_and_value) {
  auto key = bazaar::schema::hash32_t{};
  key[0] = 9;
  auto ed = bazaar::schema::ed25519_signer_id{.public_key = key};
  EXPECT_NE(bazaar::schema::signer_id_t{ed},
            bazaar::schema::signer_id_t{bazaar::schema::named_signer_t{key}});
  EXPECT_EQ(bazaar::schema::signer_id_t{ed}, bazaar::schema::signer_id_t{ed});
}
