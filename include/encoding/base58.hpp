#pragma once
#include <string>
#include <vector>
#include <cryptopp/secblock.h>

namespace Base58 {
  // Bitcoin alphabet; leading zero bytes map to leading '1's.
  std::string Encode(const unsigned char* data, size_t len);
  std::string Encode(const std::vector<unsigned char>& data);
  // Strict: any character outside the alphabet (whitespace included) fails.
  bool Decode(const std::string& text, std::vector<unsigned char>& out);
  // Same as above, with every intermediate buffer in wiping memory. Used for seeds.
  bool Decode(const std::string& text, CryptoPP::SecByteBlock& out);
}
