#pragma once
#include "common/result.hpp"
#include "wallet/tx_submitter.hpp"
#include <string>
#include <vector>

enum class Command { SIGN_AND_SUBMIT, TRANSFER, SHOW_PUBKEY, BALANCE, HELP };

struct Invocation {
  Command command = Command::HELP;
  std::string seed_b58;      // "-" means read it from stdin
  std::string address_b58;   // BALANCE only
  CallRequest request;       // SIGN_AND_SUBMIT and TRANSFER
};

// args excludes the program name.
Result<Invocation> ParseInvocation(const std::vector<std::string>& args, const std::string& default_network);
std::string UsageText(const std::string& program);
