#include "utils/hex.hpp"
#include <cctype>
#include <cryptopp/filters.h>
#include <cryptopp/hex.h>

std::optional<std::vector<unsigned char>> DecodeHex(const std::string& hex) {
  std::string digits = Strip0x(hex);
  if (digits.size() % 2 != 0) return std::nullopt;
  // HexDecoder skips characters it does not understand, so validate first
  for (char c : digits) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  std::string decoded;
  CryptoPP::StringSource source(digits, true,
      new CryptoPP::HexDecoder(new CryptoPP::StringSink(decoded)));
  return std::vector<unsigned char>(decoded.begin(), decoded.end());
}

std::string EncodeHex(const std::vector<unsigned char>& data) {
  std::string out;
  CryptoPP::ArraySource source(data.data(), data.size(), true,
      new CryptoPP::HexEncoder(new CryptoPP::StringSink(out), false));
  return out;
}
