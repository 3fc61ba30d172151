#pragma once
#include <string>
#include <vector>
#include <cryptopp/secblock.h>

// BLS12-381, minimal-pubkey-size variant: public keys in G1, signatures in G2.
namespace Crypto {
  constexpr size_t SECRET_KEY_SIZE = 32;
  constexpr size_t PUBLIC_KEY_SIZE = 48;   // compressed G1
  constexpr size_t SIGNATURE_SIZE = 96;    // compressed G2
  constexpr size_t SIGNING_PAYLOAD_SIZE = 32;

  // Group order r, big-endian
  extern const unsigned char GROUP_ORDER_BE[SECRET_KEY_SIZE];

  // Reads the seed as a little-endian integer of any length and writes (seed mod r)
  // as 32 big-endian bytes. Returns false when the seed is empty or reduces to zero.
  bool ReduceSeedToScalar(const CryptoPP::SecByteBlock& seed, CryptoPP::SecByteBlock& secret_be);
  // Derive compressed public key (48 bytes) sk * G1 from a 32-byte big-endian scalar
  std::vector<unsigned char> PublicKeyFromSecret(const CryptoPP::SecByteBlock& secret_be);
  // hash_to_curve(message, dst) in G2 multiplied by sk; compressed (96 bytes)
  std::vector<unsigned char> SignMessage(const CryptoPP::SecByteBlock& secret_be,
                                         const std::vector<unsigned char>& message,
                                         const std::string& dst);
  bool VerifySignature(const std::vector<unsigned char>& public_key,
                       const std::vector<unsigned char>& signature,
                       const std::vector<unsigned char>& message,
                       const std::string& dst);
}
