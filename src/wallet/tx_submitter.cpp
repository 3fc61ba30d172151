#include "wallet/tx_submitter.hpp"
#include "common/logger.hpp"
#include "constants/amadeus.hpp"
#include "crypto/bls.hpp"
#include "encoding/base58.hpp"
#include "node_connection/mcp_client.hpp"
#include "utils/hex.hpp"
#include "wallet/keypair.hpp"
#include "wallet/signer.hpp"

using json = nlohmann::json;

const char* SubmitStateName(SubmitState state) {
  switch (state) {
    case SubmitState::IDLE: return "idle";
    case SubmitState::AWAITING_UNSIGNED_TX: return "awaiting_unsigned_tx";
    case SubmitState::AWAITING_BROADCAST: return "awaiting_broadcast";
    case SubmitState::DONE: return "done";
    case SubmitState::FAILED: return "failed";
  }
  return "unknown";
}

TxSubmitter::TxSubmitter(McpClient& mcp, const Signer& signer, const SubmitOptions& options)
  : mcp_(mcp), signer_(signer), options_(options) {}

void TxSubmitter::Transition(SubmitState next) {
  Logger::Debug(std::string("submitter ") + SubmitStateName(state_) + " -> " + SubmitStateName(next));
  state_ = next;
}

SignerError TxSubmitter::Fail(const SignerError& error) {
  Logger::Error("submission failed in state " + std::string(SubmitStateName(state_)) + ": " + error.ToString());
  Transition(SubmitState::FAILED);
  return error;
}

Result<UnsignedTx> TxSubmitter::RequestUnsignedTx(const CallRequest& request) {
  const std::string& tool = AmadeusConstants::TOOL_CREATE_TRANSACTION;
  json arguments = {
    {"signer", signer_.Address()},
    {"contract", request.contract},
    {"function", request.function},
    {"args", request.args}
  };
  auto response = mcp_.CallTool(tool, arguments);
  if (!response) return response.Error();

  const json& body = response.Value();
  if (!body.is_object()) {
    return MakeError(ErrorKind::PROTOCOL_VIOLATION, tool, "expected an object with blob and signing_payload");
  }
  auto blob = body.find("blob");
  if (blob == body.end() || blob->is_null()) {
    return MakeError(ErrorKind::PROTOCOL_VIOLATION, tool, "response has no blob");
  }
  auto payload = body.find("signing_payload");
  if (payload == body.end() || !payload->is_string()) {
    return MakeError(ErrorKind::PROTOCOL_VIOLATION, tool, "response has no signing_payload");
  }
  auto payload_bytes = DecodeHex(payload->get<std::string>());
  if (!payload_bytes) {
    return MakeError(ErrorKind::DECODE, tool, "signing_payload is not hex");
  }
  if (payload_bytes->size() != Crypto::SIGNING_PAYLOAD_SIZE) {
    return MakeError(ErrorKind::PROTOCOL_VIOLATION, tool,
                     "signing_payload has " + std::to_string(payload_bytes->size()) + " bytes, expected " +
                     std::to_string(Crypto::SIGNING_PAYLOAD_SIZE));
  }
  UnsignedTx tx;
  tx.blob = *blob;
  tx.signing_payload = std::move(*payload_bytes);
  return tx;
}

Result<json> TxSubmitter::SubmitSigned(const UnsignedTx& tx, const std::string& signature_b58,
                                       const std::string& network) {
  json arguments = {
    {"transaction", tx.blob},
    {"signature", signature_b58},
    {"network", network}
  };
  return mcp_.CallTool(AmadeusConstants::TOOL_SUBMIT_TRANSACTION, arguments);
}

Result<json> TxSubmitter::Run(const CallRequest& request) {
  state_ = SubmitState::IDLE;
  Logger::Info("building " + request.contract + "." + request.function + " for " + signer_.Address() +
               " on " + request.network);

  Transition(SubmitState::AWAITING_UNSIGNED_TX);
  auto unsigned_tx = RequestUnsignedTx(request);
  if (!unsigned_tx) {
    return Fail(unsigned_tx.WithContext(AmadeusConstants::TOOL_CREATE_TRANSACTION).Error());
  }
  const UnsignedTx& tx = unsigned_tx.Value();

  auto signature = signer_.Sign(tx.signing_payload);
  if (!signature) return Fail(signature.Error());
  if (options_.verify_before_submit && !signer_.Verify(tx.signing_payload, signature.Value())) {
    return Fail(MakeError(ErrorKind::PROTOCOL_VIOLATION, "sign", "signature failed local verification"));
  }

  Transition(SubmitState::AWAITING_BROADCAST);
  auto result = SubmitSigned(tx, Base58::Encode(signature.Value()), request.network);
  if (!result) {
    return Fail(result.WithContext(AmadeusConstants::TOOL_SUBMIT_TRANSACTION).Error());
  }
  Transition(SubmitState::DONE);
  Logger::Info("transaction submitted on " + request.network);
  return result;
}

Result<json> SignAndSubmit(const std::string& seed_b58, const CallRequest& request,
                           McpClient& mcp, const SubmitOptions& options) {
  auto keys = DeriveKeypair(seed_b58);
  if (!keys) return keys.Error();
  Signer signer(std::move(keys.Value()));
  TxSubmitter submitter(mcp, signer, options);
  return submitter.Run(request);
}

CallRequest BuildTransferRequest(const std::string& recipient_b58, const std::string& amount,
                                 const std::string& symbol, const std::string& network) {
  CallRequest request;
  request.contract = AmadeusConstants::COIN_CONTRACT;
  request.function = AmadeusConstants::COIN_TRANSFER;
  request.args = json::array({ json{{"b58", recipient_b58}}, amount, symbol });
  request.network = network;
  return request;
}

Result<json> QueryBalance(McpClient& mcp, const std::string& address_b58) {
  std::vector<unsigned char> raw;
  if (!Base58::Decode(address_b58, raw) || raw.size() != Crypto::PUBLIC_KEY_SIZE) {
    return MakeError(ErrorKind::DECODE, AmadeusConstants::TOOL_GET_ACCOUNT_BALANCE,
                     "address must be a base58 encoded 48-byte public key");
  }
  return mcp.CallTool(AmadeusConstants::TOOL_GET_ACCOUNT_BALANCE, json{{"address", address_b58}});
}
