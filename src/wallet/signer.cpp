#include "wallet/signer.hpp"
#include "common/logger.hpp"
#include "constants/amadeus.hpp"
#include "crypto/bls.hpp"
#include "encoding/base58.hpp"
#include <utility>

Signer::Signer(KeyPair keys) : keys_(std::move(keys)) {
  address_ = keys_.PublicKeyBase58();
}

Result<std::vector<unsigned char>> Signer::Sign(const std::vector<unsigned char>& signing_payload) const {
  if (signing_payload.size() != Crypto::SIGNING_PAYLOAD_SIZE) {
    return MakeError(ErrorKind::PROTOCOL_VIOLATION, "sign",
                     "signing payload must be " + std::to_string(Crypto::SIGNING_PAYLOAD_SIZE) +
                     " bytes, got " + std::to_string(signing_payload.size()));
  }
  auto signature = Crypto::SignMessage(keys_.secret, signing_payload, AmadeusConstants::TX_DST);
  Logger::Debug("signed payload for " + address_);
  return signature;
}

Result<std::string> Signer::SignBase58(const std::vector<unsigned char>& signing_payload) const {
  auto signature = Sign(signing_payload);
  if (!signature) return signature.Error();
  return Base58::Encode(signature.Value());
}

bool Signer::Verify(const std::vector<unsigned char>& signing_payload,
                    const std::vector<unsigned char>& signature) const {
  return Crypto::VerifySignature(keys_.public_key, signature, signing_payload, AmadeusConstants::TX_DST);
}
