#include "crypto/bls.hpp"
#include <blst.h>
#include <cryptopp/misc.h>
#include <cstring>
#include <stdexcept>

namespace Crypto {
  const unsigned char GROUP_ORDER_BE[SECRET_KEY_SIZE] = {
    0x73, 0xed, 0xa7, 0x53, 0x29, 0x9d, 0x7d, 0x48, 0x33, 0x39, 0xd8, 0x08, 0x09, 0xa1, 0xd8, 0x05,
    0x53, 0xbd, 0xa4, 0x02, 0xff, 0xfe, 0x5b, 0xfe, 0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x01
  };

  namespace {
    // Secret scalar that is wiped when it goes out of scope
    struct ScopedScalar {
      blst_scalar value;
      ScopedScalar() { std::memset(&value, 0, sizeof(value)); }
      ~ScopedScalar() { CryptoPP::SecureWipeBuffer(value.b, sizeof(value.b)); }
      ScopedScalar(const ScopedScalar&) = delete;
      ScopedScalar& operator=(const ScopedScalar&) = delete;
    };

    void LoadSecret(const CryptoPP::SecByteBlock& secret_be, ScopedScalar& sk) {
      if (secret_be.size() != SECRET_KEY_SIZE) throw std::invalid_argument("bad secret key size");
      blst_scalar_from_bendian(&sk.value, secret_be.BytePtr());
      if (!blst_sk_check(&sk.value)) throw std::invalid_argument("secret key out of range");
    }

    const byte* DstBytes(const std::string& dst) { return reinterpret_cast<const byte*>(dst.data()); }
  }

  bool ReduceSeedToScalar(const CryptoPP::SecByteBlock& seed, CryptoPP::SecByteBlock& secret_be) {
    // blst reads past the buffer for a zero-length input
    if (seed.empty()) return false;
    ScopedScalar sk;
    if (!blst_scalar_from_le_bytes(&sk.value, seed.BytePtr(), seed.size())) return false;
    if (!blst_sk_check(&sk.value)) return false;
    secret_be.CleanNew(SECRET_KEY_SIZE);
    blst_bendian_from_scalar(secret_be.BytePtr(), &sk.value);
    return true;
  }

  std::vector<unsigned char> PublicKeyFromSecret(const CryptoPP::SecByteBlock& secret_be) {
    ScopedScalar sk;
    LoadSecret(secret_be, sk);
    blst_p1 pk;
    blst_sk_to_pk_in_g1(&pk, &sk.value);
    std::vector<unsigned char> out(PUBLIC_KEY_SIZE);
    blst_p1_compress(out.data(), &pk);
    return out;
  }

  std::vector<unsigned char> SignMessage(const CryptoPP::SecByteBlock& secret_be,
                                         const std::vector<unsigned char>& message,
                                         const std::string& dst) {
    ScopedScalar sk;
    LoadSecret(secret_be, sk);
    blst_p2 msg_point;
    blst_hash_to_g2(&msg_point, message.data(), message.size(), DstBytes(dst), dst.size(), nullptr, 0);
    blst_p2 sig;
    blst_sign_pk_in_g1(&sig, &msg_point, &sk.value);
    std::vector<unsigned char> out(SIGNATURE_SIZE);
    blst_p2_compress(out.data(), &sig);
    return out;
  }

  bool VerifySignature(const std::vector<unsigned char>& public_key,
                       const std::vector<unsigned char>& signature,
                       const std::vector<unsigned char>& message,
                       const std::string& dst) {
    if (public_key.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) return false;
    blst_p1_affine pk;
    if (blst_p1_uncompress(&pk, public_key.data()) != BLST_SUCCESS) return false;
    if (blst_p1_affine_is_inf(&pk) || !blst_p1_affine_in_g1(&pk)) return false;
    blst_p2_affine sig;
    if (blst_p2_uncompress(&sig, signature.data()) != BLST_SUCCESS) return false;
    if (!blst_p2_affine_in_g2(&sig)) return false;
    BLST_ERROR rc = blst_core_verify_pk_in_g1(&pk, &sig, true, message.data(), message.size(),
                                              DstBytes(dst), dst.size(), nullptr, 0);
    return rc == BLST_SUCCESS;
  }
}
