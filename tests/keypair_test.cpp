#include "wallet/keypair.hpp"
#include "crypto/bls.hpp"
#include "encoding/base58.hpp"
#include "utils/hex.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

// 64 bytes of 0xff
const std::string SEED_ALL_FF =
    "67rpwLCuS5DGA8KGZXKsVQ7dnPb9goRLoKfgGbLfQg9WoLUgNY77E2jT11fem3coV9nAkguBACzrU1iyZM4B8roQ";
// bytes 0x01..0x40
const std::string SEED_SEQUENCE =
    "2Ana1pUpv2ZbMVkwF5FXapYeBEjdxDatLn7nvJkhgTSXbs59SyZSx866bXirPgj8QQVB57uxHJBG1YFvkRbFj4T";
// the group order r as 32 little-endian bytes
const std::string SEED_EQUAL_TO_ORDER = "4uQeYMoPxKVyteDRTQvm5NDcaUTF6jq7xb3tdCYB97Q";
// r + 5 as 32 little-endian bytes
const std::string SEED_ORDER_PLUS_FIVE = "QRSt1zDs8o52MF5xykAEi6MudJJmrFN3J8VQbkWnAR8";

std::string SecretHex(const KeyPair& keys) {
  return EncodeHex(std::vector<unsigned char>(keys.secret.begin(), keys.secret.end()));
}

bool BelowGroupOrder(const KeyPair& keys) {
  return std::lexicographical_compare(keys.secret.begin(), keys.secret.end(),
                                      Crypto::GROUP_ORDER_BE, Crypto::GROUP_ORDER_BE + Crypto::SECRET_KEY_SIZE);
}

}

TEST(KeypairTest, DerivationIsDeterministic) {
  auto first = DeriveKeypair(SEED_SEQUENCE);
  auto second = DeriveKeypair(SEED_SEQUENCE);
  ASSERT_TRUE(first.IsOk());
  ASSERT_TRUE(second.IsOk());
  EXPECT_EQ(SecretHex(first.Value()), SecretHex(second.Value()));
  EXPECT_EQ(first.Value().public_key, second.Value().public_key);
  EXPECT_EQ(first.Value().PublicKeyBase58(), second.Value().PublicKeyBase58());
}

TEST(KeypairTest, WideSeedIsReducedModuloGroupOrder) {
  auto ff = DeriveKeypair(SEED_ALL_FF);
  ASSERT_TRUE(ff.IsOk());
  EXPECT_EQ(SecretHex(ff.Value()), "0748d9d99f59ff1105d314967254398f2b6cedcb87925c23c999e990f3f29c6c");
  EXPECT_TRUE(BelowGroupOrder(ff.Value()));

  auto seq = DeriveKeypair(SEED_SEQUENCE);
  ASSERT_TRUE(seq.IsOk());
  EXPECT_EQ(SecretHex(seq.Value()), "0e0471dc1dfb4d9d546de9c99a76991b10cd3626dce8f40da5d95724c6e2b509");
  EXPECT_TRUE(BelowGroupOrder(seq.Value()));
}

TEST(KeypairTest, SeedJustAboveOrderWrapsAround) {
  auto keys = DeriveKeypair(SEED_ORDER_PLUS_FIVE);
  ASSERT_TRUE(keys.IsOk());
  EXPECT_EQ(SecretHex(keys.Value()), std::string(62, '0') + "05");
}

TEST(KeypairTest, SeedReducingToZeroIsRejected) {
  auto keys = DeriveKeypair(SEED_EQUAL_TO_ORDER);
  ASSERT_FALSE(keys.IsOk());
  EXPECT_EQ(keys.Error().kind, ErrorKind::DECODE);
  EXPECT_EQ(keys.Error().context, "derive_keypair");
}

TEST(KeypairTest, MalformedSeedTextIsDecodeError) {
  const std::string bad = "0OIl-not-base58";
  auto keys = DeriveKeypair(bad);
  ASSERT_FALSE(keys.IsOk());
  EXPECT_EQ(keys.Error().kind, ErrorKind::DECODE);
  EXPECT_EQ(keys.Error().ToString().find(bad), std::string::npos);
}

TEST(KeypairTest, EmptySeedIsRejected) {
  auto keys = DeriveKeypair("");
  ASSERT_FALSE(keys.IsOk());
  EXPECT_EQ(keys.Error().kind, ErrorKind::DECODE);
}

TEST(KeypairTest, PublicKeyIsCompressedG1) {
  auto keys = DeriveKeypair(SEED_ALL_FF);
  ASSERT_TRUE(keys.IsOk());
  const auto& pk = keys.Value().public_key;
  ASSERT_EQ(pk.size(), Crypto::PUBLIC_KEY_SIZE);
  EXPECT_EQ(pk[0] & 0x80, 0x80);
  EXPECT_EQ(pk, Crypto::PublicKeyFromSecret(keys.Value().secret));

  std::vector<unsigned char> decoded;
  ASSERT_TRUE(Base58::Decode(keys.Value().PublicKeyBase58(), decoded));
  EXPECT_EQ(decoded, pk);
}

TEST(KeypairTest, DifferentSeedsGiveDifferentKeys) {
  auto a = DeriveKeypair(SEED_ALL_FF);
  auto b = DeriveKeypair(SEED_SEQUENCE);
  ASSERT_TRUE(a.IsOk());
  ASSERT_TRUE(b.IsOk());
  EXPECT_NE(a.Value().public_key, b.Value().public_key);
}
