#include "cli/invocation.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

static SignerError UsageError(const std::string& message) {
  return MakeError(ErrorKind::USAGE, "arguments", message);
}

static bool IsDecimal(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); });
}

static Result<Invocation> ParseSign(const std::vector<std::string>& args, const std::string& default_network) {
  if (args.size() < 4) return UsageError("expected <seed_b58> <contract> <function> <args_json> [network]");
  if (args.size() > 5) return UsageError("too many arguments");
  Invocation inv;
  inv.command = Command::SIGN_AND_SUBMIT;
  inv.seed_b58 = args[0];
  inv.request.contract = args[1];
  inv.request.function = args[2];
  inv.request.args = json::parse(args[3], nullptr, false);
  if (inv.request.args.is_discarded()) return UsageError("args_json is not valid JSON");
  inv.request.network = args.size() == 5 ? args[4] : default_network;
  if (inv.request.contract.empty() || inv.request.function.empty()) {
    return UsageError("contract and function must not be empty");
  }
  if (inv.request.network.empty()) return UsageError("network must not be empty");
  return inv;
}

static Result<Invocation> ParseTransfer(const std::vector<std::string>& args, const std::string& default_network) {
  // args[0] is the flag
  if (args.size() < 5) return UsageError("expected --transfer <seed_b58> <recipient_b58> <amount> <symbol> [network]");
  if (args.size() > 6) return UsageError("too many arguments");
  if (!IsDecimal(args[3])) return UsageError("amount must be a non-negative integer in base units");
  if (args[4].empty()) return UsageError("symbol must not be empty");
  if (args.size() == 6 && args[5].empty()) return UsageError("network must not be empty");
  Invocation inv;
  inv.command = Command::TRANSFER;
  inv.seed_b58 = args[1];
  inv.request = BuildTransferRequest(args[2], args[3], args[4], args.size() == 6 ? args[5] : default_network);
  return inv;
}

Result<Invocation> ParseInvocation(const std::vector<std::string>& args, const std::string& default_network) {
  if (args.empty()) return UsageError("missing arguments");
  const std::string& first = args[0];
  if (first == "-h" || first == "--help") {
    Invocation inv;
    inv.command = Command::HELP;
    return inv;
  }
  if (first == "--transfer") return ParseTransfer(args, default_network);
  if (first == "--pubkey") {
    if (args.size() != 2) return UsageError("expected --pubkey <seed_b58>");
    Invocation inv;
    inv.command = Command::SHOW_PUBKEY;
    inv.seed_b58 = args[1];
    return inv;
  }
  if (first == "--balance") {
    if (args.size() != 2) return UsageError("expected --balance <address_b58>");
    Invocation inv;
    inv.command = Command::BALANCE;
    inv.address_b58 = args[1];
    return inv;
  }
  if (first.size() > 1 && first[0] == '-' && first[1] == '-') return UsageError("unknown option " + first);
  return ParseSign(args, default_network);
}

std::string UsageText(const std::string& program) {
  std::ostringstream oss;
  oss << "Usage:\n"
      << "  " << program << " <seed_b58> <contract> <function> <args_json> [network]\n"
      << "  " << program << " --transfer <seed_b58> <recipient_b58> <amount> <symbol> [network]\n"
      << "  " << program << " --pubkey <seed_b58>\n"
      << "  " << program << " --balance <address_b58>\n"
      << "\n"
      << "A seed of '-' is read from the first line of standard input.\n"
      << "Example:\n"
      << "  " << program << " SEED_B58 Coin transfer '[{\"b58\":\"RECIPIENT\"},\"1000000000\",\"AMA\"]' testnet\n";
  return oss.str();
}
