#pragma once
#include "common/result.hpp"
#include "wallet/keypair.hpp"
#include <string>
#include <vector>

// Signs server-provided transaction hashes under one key pair.
class Signer {
public:
  explicit Signer(KeyPair keys);
  // BLS signature over a 32-byte signing payload with the transaction DST
  Result<std::vector<unsigned char>> Sign(const std::vector<unsigned char>& signing_payload) const;
  Result<std::string> SignBase58(const std::vector<unsigned char>& signing_payload) const;
  bool Verify(const std::vector<unsigned char>& signing_payload,
              const std::vector<unsigned char>& signature) const;
  // Signer identity: base58 of the compressed public key
  std::string Address() const { return address_; }
  const std::vector<unsigned char>& PublicKey() const { return keys_.public_key; }
private:
  KeyPair keys_;
  std::string address_;
};
