#include "wallet/keypair.hpp"
#include "crypto/bls.hpp"
#include "encoding/base58.hpp"

static const char* DERIVE_CONTEXT = "derive_keypair";

std::string KeyPair::PublicKeyBase58() const { return Base58::Encode(public_key); }

Result<KeyPair> DeriveKeypairFromSeed(const CryptoPP::SecByteBlock& seed) {
  KeyPair keys;
  if (!Crypto::ReduceSeedToScalar(seed, keys.secret)) {
    return MakeError(ErrorKind::DECODE, DERIVE_CONTEXT, "seed does not yield a usable secret key");
  }
  keys.public_key = Crypto::PublicKeyFromSecret(keys.secret);
  return keys;
}

Result<KeyPair> DeriveKeypair(const std::string& seed_b58) {
  CryptoPP::SecByteBlock seed;
  // the message must not echo the seed text
  if (!Base58::Decode(seed_b58, seed)) {
    return MakeError(ErrorKind::DECODE, DERIVE_CONTEXT, "seed is not valid base58");
  }
  return DeriveKeypairFromSeed(seed);
}
