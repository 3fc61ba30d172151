#pragma once
#include "common/result.hpp"
#include <string>
#include <vector>
#include <cryptopp/secblock.h>

struct KeyPair {
  CryptoPP::SecByteBlock secret;         // 32-byte big-endian scalar, < group order
  std::vector<unsigned char> public_key; // 48-byte compressed G1 point
  std::string PublicKeyBase58() const;
};

// Decodes a base58 seed and derives the key pair. Same seed, same keys.
Result<KeyPair> DeriveKeypair(const std::string& seed_b58);
Result<KeyPair> DeriveKeypairFromSeed(const CryptoPP::SecByteBlock& seed);
