#include "encoding/base58.hpp"
#include <cstring>

namespace Base58 {
  static const char* ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

  static int DigitValue(char c) {
    const char* p = std::strchr(ALPHABET, c);
    if (c == '\0' || p == nullptr) return -1;
    return static_cast<int>(p - ALPHABET);
  }

  std::string Encode(const unsigned char* data, size_t len) {
    size_t zeroes = 0;
    while (zeroes < len && data[zeroes] == 0) ++zeroes;
    // log(256) / log(58), rounded up
    std::vector<unsigned char> b58((len - zeroes) * 138 / 100 + 1, 0);
    size_t used = 0;
    for (size_t i = zeroes; i < len; ++i) {
      int carry = data[i];
      size_t k = 0;
      for (auto it = b58.rbegin(); (carry != 0 || k < used) && it != b58.rend(); ++it, ++k) {
        carry += 256 * (*it);
        *it = static_cast<unsigned char>(carry % 58);
        carry /= 58;
      }
      used = k;
    }
    auto it = b58.begin() + (b58.size() - used);
    while (it != b58.end() && *it == 0) ++it;
    std::string out;
    out.reserve(zeroes + (b58.end() - it));
    out.assign(zeroes, '1');
    for (; it != b58.end(); ++it) out += ALPHABET[*it];
    return out;
  }

  std::string Encode(const std::vector<unsigned char>& data) { return Encode(data.data(), data.size()); }

  bool Decode(const std::string& text, CryptoPP::SecByteBlock& out) {
    size_t i = 0, zeroes = 0;
    while (i < text.size() && text[i] == '1') { ++zeroes; ++i; }
    // log(58) / log(256), rounded up
    CryptoPP::SecByteBlock b256;
    b256.CleanNew((text.size() - i) * 733 / 1000 + 1);
    unsigned char* buf = b256.BytePtr();
    for (; i < text.size(); ++i) {
      int carry = DigitValue(text[i]);
      if (carry < 0) return false;
      for (size_t j = b256.size(); j-- > 0;) {
        carry += 58 * buf[j];
        buf[j] = static_cast<unsigned char>(carry & 0xff);
        carry >>= 8;
      }
      if (carry != 0) return false;
    }
    size_t skip = 0;
    while (skip < b256.size() && buf[skip] == 0) ++skip;
    out.CleanNew(zeroes + (b256.size() - skip));
    if (b256.size() > skip) std::memcpy(out.BytePtr() + zeroes, buf + skip, b256.size() - skip);
    return true;
  }

  bool Decode(const std::string& text, std::vector<unsigned char>& out) {
    CryptoPP::SecByteBlock bytes;
    if (!Decode(text, bytes)) return false;
    out.assign(bytes.begin(), bytes.end());
    return true;
  }
}
