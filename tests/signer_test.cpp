#include "wallet/signer.hpp"
#include "constants/amadeus.hpp"
#include "crypto/bls.hpp"
#include "encoding/base58.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

const std::string SEED_A =
    "67rpwLCuS5DGA8KGZXKsVQ7dnPb9goRLoKfgGbLfQg9WoLUgNY77E2jT11fem3coV9nAkguBACzrU1iyZM4B8roQ";
const std::string SEED_B =
    "2Ana1pUpv2ZbMVkwF5FXapYeBEjdxDatLn7nvJkhgTSXbs59SyZSx866bXirPgj8QQVB57uxHJBG1YFvkRbFj4T";

Signer MakeSigner(const std::string& seed) {
  auto keys = DeriveKeypair(seed);
  EXPECT_TRUE(keys.IsOk());
  return Signer(keys.Value());
}

std::vector<unsigned char> Payload() {
  std::vector<unsigned char> p(32);
  for (size_t i = 0; i < p.size(); ++i) p[i] = static_cast<unsigned char>(i * 7 + 3);
  return p;
}

}

class SignerTest : public ::testing::Test {
 protected:
  Signer signer_ = MakeSigner(SEED_A);
  Signer other_ = MakeSigner(SEED_B);
};

TEST_F(SignerTest, SignatureVerifiesUnderOwnKeyAndTransactionTag) {
  auto sig = signer_.Sign(Payload());
  ASSERT_TRUE(sig.IsOk());
  ASSERT_EQ(sig.Value().size(), Crypto::SIGNATURE_SIZE);
  EXPECT_TRUE(Crypto::VerifySignature(signer_.PublicKey(), sig.Value(), Payload(), AmadeusConstants::TX_DST));
  EXPECT_TRUE(signer_.Verify(Payload(), sig.Value()));
}

TEST_F(SignerTest, SignatureRejectedForAnotherKey) {
  auto sig = signer_.Sign(Payload());
  ASSERT_TRUE(sig.IsOk());
  EXPECT_FALSE(Crypto::VerifySignature(other_.PublicKey(), sig.Value(), Payload(), AmadeusConstants::TX_DST));
  EXPECT_FALSE(other_.Verify(Payload(), sig.Value()));
}

TEST_F(SignerTest, SignatureRejectedForAnyFlippedPayloadBit) {
  auto sig = signer_.Sign(Payload());
  ASSERT_TRUE(sig.IsOk());
  for (size_t bit : {0u, 7u, 100u, 255u}) {
    auto altered = Payload();
    altered[bit / 8] ^= static_cast<unsigned char>(1u << (bit % 8));
    EXPECT_FALSE(signer_.Verify(altered, sig.Value())) << "bit " << bit;
  }
}

TEST_F(SignerTest, SignatureRejectedUnderAnotherTag) {
  auto sig = signer_.Sign(Payload());
  ASSERT_TRUE(sig.IsOk());
  EXPECT_FALSE(Crypto::VerifySignature(signer_.PublicKey(), sig.Value(), Payload(),
                                       "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_NUL_"));
}

TEST_F(SignerTest, SigningIsDeterministic) {
  auto first = signer_.Sign(Payload());
  auto second = signer_.Sign(Payload());
  ASSERT_TRUE(first.IsOk());
  ASSERT_TRUE(second.IsOk());
  EXPECT_EQ(first.Value(), second.Value());
}

TEST_F(SignerTest, WrongPayloadLengthIsRejected) {
  for (size_t len : {0u, 31u, 33u, 64u}) {
    auto sig = signer_.Sign(std::vector<unsigned char>(len, 0));
    ASSERT_FALSE(sig.IsOk()) << "length " << len;
    EXPECT_EQ(sig.Error().kind, ErrorKind::PROTOCOL_VIOLATION);
  }
}

TEST_F(SignerTest, Base58SignatureDecodesToTheSamePoint) {
  auto raw = signer_.Sign(Payload());
  auto text = signer_.SignBase58(Payload());
  ASSERT_TRUE(raw.IsOk());
  ASSERT_TRUE(text.IsOk());
  std::vector<unsigned char> decoded;
  ASSERT_TRUE(Base58::Decode(text.Value(), decoded));
  EXPECT_EQ(decoded, raw.Value());
  EXPECT_TRUE(signer_.Verify(Payload(), decoded));
}

TEST_F(SignerTest, AddressIsBase58PublicKey) {
  std::vector<unsigned char> decoded;
  ASSERT_TRUE(Base58::Decode(signer_.Address(), decoded));
  EXPECT_EQ(decoded, signer_.PublicKey());
  EXPECT_NE(signer_.Address(), other_.Address());
}
