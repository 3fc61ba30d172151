#pragma once
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// Strict decode: optional 0x prefix, even length, hex digits only.
std::optional<std::vector<unsigned char>> DecodeHex(const std::string& hex);
// Lowercase, no prefix.
std::string EncodeHex(const std::vector<unsigned char>& data);
