#pragma once
#include "common/result.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class McpClient;
class Signer;

enum class SubmitState { IDLE, AWAITING_UNSIGNED_TX, AWAITING_BROADCAST, DONE, FAILED };

const char* SubmitStateName(SubmitState state);

struct CallRequest {
  std::string contract;
  std::string function;
  nlohmann::json args = nlohmann::json::array();  // forwarded as-is
  std::string network;
};

struct UnsignedTx {
  nlohmann::json blob;                          // opaque, passed back unmodified
  std::vector<unsigned char> signing_payload;   // 32-byte hash to sign
};

struct SubmitOptions {
  // Check the fresh signature against our own public key before broadcasting it
  bool verify_before_submit = true;
};

// Two-call protocol: create_transaction -> local sign -> submit_transaction.
// Each remote call is attempted once; a failure in any phase ends the run in FAILED.
class TxSubmitter {
public:
  TxSubmitter(McpClient& mcp, const Signer& signer, const SubmitOptions& options = SubmitOptions());
  Result<nlohmann::json> Run(const CallRequest& request);
  SubmitState State() const { return state_; }
private:
  McpClient& mcp_;
  const Signer& signer_;
  SubmitOptions options_;
  SubmitState state_ = SubmitState::IDLE;
  Result<UnsignedTx> RequestUnsignedTx(const CallRequest& request);
  Result<nlohmann::json> SubmitSigned(const UnsignedTx& tx, const std::string& signature_b58,
                                      const std::string& network);
  void Transition(SubmitState next);
  SignerError Fail(const SignerError& error);
};

// Full pipeline for one invocation: derive keys from the seed, then run the submitter.
// A seed that does not decode fails before any network traffic.
Result<nlohmann::json> SignAndSubmit(const std::string& seed_b58, const CallRequest& request,
                                     McpClient& mcp, const SubmitOptions& options = SubmitOptions());

// Coin.transfer with args [{"b58": recipient}, amount, symbol]
CallRequest BuildTransferRequest(const std::string& recipient_b58, const std::string& amount,
                                 const std::string& symbol, const std::string& network);

// Read-only balance lookup through the get_account_balance tool
Result<nlohmann::json> QueryBalance(McpClient& mcp, const std::string& address_b58);
